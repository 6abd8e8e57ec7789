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

#include "skyrelay/objstore/object_store_factory.h"

#include <glog/logging.h>

#include "skyrelay/objstore/local_object_store.h"

#ifdef HAVE_AWS_SDK
#include "skyrelay/objstore/s3_interface.h"
#endif

namespace skyrelay {

tl::expected<std::unique_ptr<ObjectStoreInterface>, ErrorCode>
CreateObjectStore(const ObjectStoreEndpoint& endpoint,
                  const std::string& local_root) {
    auto parts = ParseRegionTag(endpoint.region_tag);
    if (!parts) return tl::make_unexpected(parts.error());

    if (parts->provider == "local") {
        return std::make_unique<LocalObjectStore>(local_root, endpoint.bucket,
                                                  parts->region);
    }
#ifdef HAVE_AWS_SDK
    if (parts->provider == "aws") {
        return std::make_unique<S3Interface>(parts->region, endpoint.bucket);
    }
#else
    if (parts->provider == "aws") {
        LOG(ERROR) << "CreateObjectStore: endpoint=" << endpoint
                   << ", error=built_without_aws_sdk";
        return tl::make_unexpected(ErrorCode::NOT_IMPLEMENTED);
    }
#endif
    LOG(ERROR) << "CreateObjectStore: endpoint=" << endpoint
               << ", provider=" << parts->provider
               << ", error=unsupported_provider";
    return tl::make_unexpected(ErrorCode::NOT_IMPLEMENTED);
}

}  // namespace skyrelay
