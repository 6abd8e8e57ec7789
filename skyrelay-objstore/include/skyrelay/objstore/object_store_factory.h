// Copyright 2025 KVCache.AI
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SKYRELAY_OBJSTORE_OBJECT_STORE_FACTORY_H
#define SKYRELAY_OBJSTORE_OBJECT_STORE_FACTORY_H

#include <memory>
#include <string>

#include "skyrelay/objstore/object_store_interface.h"

namespace skyrelay {

/**
 * @brief Opens the store behind an endpoint, picked by the provider part of
 *        its region tag: "aws" (only when built with HAVE_AWS_SDK) or
 *        "local", rooted at local_root.
 * @return INVALID_REGION_TAG for a malformed tag, NOT_IMPLEMENTED for a
 *         provider this build cannot reach
 */
tl::expected<std::unique_ptr<ObjectStoreInterface>, ErrorCode>
CreateObjectStore(const ObjectStoreEndpoint& endpoint,
                  const std::string& local_root);

}  // namespace skyrelay

#endif  // SKYRELAY_OBJSTORE_OBJECT_STORE_FACTORY_H
