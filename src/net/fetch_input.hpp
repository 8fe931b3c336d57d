#pragma once

#include "net/fetch_types.hpp"
#include "nlohmann/json.hpp"

namespace toolguard::net {

// Decodes an untrusted fetch request {url, timeoutMs?, maxBytes?,
// maxRedirects?}. Throws ToolError(INVALID_INPUT). The URL itself is not
// checked here; that is NetworkPolicy's job on every hop.
FetchRequest ParseFetchInput(const nlohmann::json& raw);

}  // namespace toolguard::net
