//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionConfiguration.hpp
// Purpose: Transport session settings and their semicolon-delimited string form
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

namespace bms {

//==========================================================================================================
// SessionConfiguration
// Purpose: Configuration for BeastTransportSession.
// Fields:
//   connectTimeoutMs: Resolve + connect + TLS handshake deadline in milliseconds
//   readTimeoutMs: Write + read deadline in milliseconds
//   caFile/caPath: Optional CA bundle/path; the system trust store is used when both are empty
//   serverName: TLS SNI and hostname verification override (default: URL host)
//   verifyPeer: Verify the server certificate chain and hostname
//   minTlsVersion: "1.2" or "1.3"
//   userAgent: User-Agent sent unless the request sets its own
//   maxResponseBodyBytes: Upper bound on a buffered response body
//==========================================================================================================
struct SessionConfiguration {
    unsigned int connectTimeoutMs{10000};
    unsigned int readTimeoutMs{30000};
    std::string caFile;
    std::string caPath;
    std::string serverName;
    bool verifyPeer{true};
    std::string minTlsVersion{"1.2"};
    std::string userAgent;
    std::size_t maxResponseBodyBytes{8u * 1024u * 1024u};

    SessionConfiguration();
};

//==========================================================================================================
// parseSessionConfiguration
// Purpose: Parse `key=value; key=value` into a configuration. Unknown keys are ignored; malformed
//          numeric or boolean values are logged and leave the default in place.
// Keys:
//   connectTimeoutMs, readTimeoutMs, caFile, caPath, serverName, verifyPeer, minTlsVersion,
//   userAgent, maxResponseBodyBytes
//==========================================================================================================
SessionConfiguration parseSessionConfiguration(const std::string& config);

} // namespace bms
