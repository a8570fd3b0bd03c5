#pragma once

namespace q2browse::net {

// Performs curl_global_init once per process; cleanup is registered with atexit.
bool EnsureCurlGlobalInit();

} // namespace q2browse::net
