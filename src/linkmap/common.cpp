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
#include "linkmap/common.hpp"

namespace linkmap
{

// Static initializations.

const boost::unordered_map<Linkmap_log_component, std::string> S_LINKMAP_LOG_COMPONENT_NAME_MAP
  ({
     { Linkmap_log_component::S_UNCAT, "UNCAT" },
     { Linkmap_log_component::S_MAP, "MAP" }
   });

} // namespace linkmap
