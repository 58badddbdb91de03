#pragma once

#include "tai/common/http.hpp"
#include "tai/common/result.hpp"
#include "tai/config/schema.hpp"
#include "tai/providers/traits.hpp"

#include <memory>

namespace tai::providers {

[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const config::EffectiveProvider &settings,
                std::shared_ptr<common::HttpClient> http_client);

} // namespace tai::providers
