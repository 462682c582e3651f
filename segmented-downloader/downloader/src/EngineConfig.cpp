// =============================================================================
// EngineConfig.cpp
// =============================================================================

#include "EngineConfig.h"

namespace SegmentedDownloader {

void applyHttpOptions(IHttpHandle& handle, const HttpOptions& options,
                      const HeaderList& headers) {
    handle.setConnectTimeout(options.connectTimeoutSec);
    handle.setTimeout(options.timeoutSec);
    handle.setLowSpeedLimit(options.lowSpeedLimit, options.lowSpeedTimeSec);
    handle.setFollowLocation(options.followRedirects, options.maxRedirects);
    handle.setSslVerify(options.sslVerify);
    handle.setUserAgent(options.userAgent);
    handle.setRequestHeaders(headers);
}

} // namespace SegmentedDownloader
