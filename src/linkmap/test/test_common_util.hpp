/* Linkmap
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace linkmap::test
{

/**
 * Whether `output` contains a match for every one of `regexes` (ECMAScript syntax).
 *
 * @param output
 *        Text to search.
 * @param regexes
 *        Patterns.
 * @return See above.
 */
bool check_output(const std::string& output, const std::vector<std::string>& regexes);

/**
 * Runs `func` while diverting what it writes to `os`, and returns that text.  Also writes it to `os` afterwards
 * unless `echo` is `false`.
 *
 * @param func
 *        Code to run.
 * @param os
 *        Stream to capture.
 * @param echo
 *        Whether to pass the output through as well.
 * @return See above.
 */
std::string collect_output(const std::function<void()>& func, std::ostream& os = std::cout, bool echo = true);

} // namespace linkmap::test
