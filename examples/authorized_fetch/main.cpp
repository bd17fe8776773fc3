//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Fetch a URL through AuthorizingSession using a static bearer token or OAuth2 client credentials
//==========================================================================================================

#include <chrono>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "logging/Logger.h"
#include "bms/AuthorizingSession.hpp"
#include "bms/BeastTransportSession.hpp"
#include "bms/SessionConfiguration.hpp"
#include "bms/analytics/AnalyticsMetadataProvider.hpp"
#include "bms/auth/BearerAuthorizationProvider.hpp"
#include "bms/auth/OAuth2ClientCredentialsProvider.hpp"

using namespace bms;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--url")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static void printUsage() {
    std::cerr << "usage: authorized_fetch --url=<http(s) url> [--method=GET] [--data=<body> | --file=<path>]\n"
              << "         [--token=<bearer token>]\n"
              << "         [--token-url=<url> --client-id=<id> --client-secret=<secret> [--scope=<scope>]]\n"
              << "         [--app=<analytics app name>] [--sessioncfg=\"readTimeoutMs=5000; verifyPeer=true\"]\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    auto url = getArgValue(argc, argv, "--url");
    if (!url) {
        printUsage();
        return 2;
    }

    const SessionConfiguration config = parseSessionConfiguration(getArgValue(argc, argv, "--sessioncfg").value_or(""));

    std::shared_ptr<auth::IAuthorizationProvider> authProvider;
    if (auto tokenUrl = getArgValue(argc, argv, "--token-url")) {
        auth::OAuth2ClientCredentialsOptions options;
        options.tokenUrl = *tokenUrl;
        options.clientId = getArgValue(argc, argv, "--client-id").value_or("");
        options.clientSecret = getArgValue(argc, argv, "--client-secret").value_or("");
        options.scope = getArgValue(argc, argv, "--scope").value_or("");
        // The token endpoint is reached through its own, undecorated transport
        auto tokenTransport = std::make_shared<BeastTransportSession>(config);
        authProvider = std::make_shared<auth::OAuth2ClientCredentialsProvider>(options, tokenTransport);
    } else {
        authProvider = std::make_shared<auth::BearerAuthorizationProvider>(getArgValue(argc, argv, "--token").value_or(""));
    }

    auto analyticsProvider = std::make_shared<analytics::AnalyticsMetadataProvider>();
    if (auto app = getArgValue(argc, argv, "--app")) {
        analyticsProvider->setMetadataFields({{"appName", *app}, {"client", "authorized_fetch"}});
    }

    // Shared with the handler: a completion arriving after the timeout path returns still has a target
    auto exitCode = std::make_shared<std::promise<int>>();
    AuthorizingSession session = AuthorizingSession::create(config, authProvider, analyticsProvider);

    HttpRequest request(*url, getArgValue(argc, argv, "--method").value_or("GET"));
    request.setValue("Accept", "*/*");

    CompletionHandler onDone = [exitCode](std::optional<HttpResponse> response,
                                         std::optional<errors::SessionError> error) {
        if (error || !response) {
            LOG_ERROR("Request failed: {}", error ? errors::describe(*error) : std::string("no response"));
            exitCode->set_value(1);
            return;
        }
        LOG_INFO("HTTP {} ({} bytes)", response->status, response->body.size());
        std::cout << response->body << std::endl;
        exitCode->set_value(response->isSuccess() ? 0 : 3);
    };

    SessionTaskPtr task;
    if (auto data = getArgValue(argc, argv, "--data")) {
        task = session.uploadTask(request, *data, std::move(onDone));
    } else if (auto file = getArgValue(argc, argv, "--file")) {
        task = session.uploadTask(request, std::filesystem::path(*file), std::move(onDone));
    } else {
        task = session.dataTask(request, std::move(onDone));
    }
    task->resume();

    auto fut = exitCode->get_future();
    const auto budget = std::chrono::milliseconds(3ull * (config.connectTimeoutMs + config.readTimeoutMs));
    if (fut.wait_for(budget) != std::future_status::ready) {
        LOG_ERROR("Timed out waiting for {}", *url);
        task->cancel();
        session.transportSession()->invalidateAndCancel();
        return 1;
    }
    const int rc = fut.get();
    session.transportSession()->invalidateAndCancel();
    return rc;
}
