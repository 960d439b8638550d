/*
 * SPDX-FileCopyrightText: Copyright (C) 2025 Kaito Udagawa umireon@kaito.tokyo
 * SPDX-License-Identifier: MIT
 *
 * DriveLink Auth
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <curl/curl.h>
#include <fmt/format.h>

#include <DriveLink/CallbackServer/LoopbackCallbackListener.hpp>
#include <DriveLink/Logger/PrintLogger.hpp>
#include <DriveLink/OAuth2/AuthError.hpp>
#include <DriveLink/OAuth2/AuthFlow.hpp>
#include <DriveLink/OAuth2/CredentialStore.hpp>
#include <DriveLink/OAuth2/CurlTokenEndpointClient.hpp>
#include <DriveLink/OAuth2/JsonFileKeyValueStore.hpp>
#include <DriveLink/OAuth2/OAuth2Config.hpp>
#include <DriveLink/OAuth2/TokenLifecycleManager.hpp>

#include "AppPaths.hpp"

using namespace DriveLink;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitAuthError = 1;
constexpr int kExitUsage = 2;

constexpr auto kLoginPollInterval = std::chrono::seconds(2);

void printUsage()
{
	fmt::print(stderr, "Usage: drivelink-auth <command> [args]\n"
			   "\n"
			   "Commands:\n"
			   "  configure <client_id> <client_secret>  Store OAuth client credentials\n"
			   "  forget                                 Remove credentials and tokens\n"
			   "  status                                 Show whether credentials and tokens exist\n"
			   "  login                                  Authorize in the browser\n"
			   "  token                                  Print a valid access token\n"
			   "  refresh                                Force a token refresh\n"
			   "  logout                                 Remove stored tokens\n");
}

class CurlGlobal {
public:
	CurlGlobal()
	{
		if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
			throw std::runtime_error("CurlGlobalInitError(CurlGlobal)");
		}
	}
	~CurlGlobal() noexcept { curl_global_cleanup(); }

	CurlGlobal(const CurlGlobal &) = delete;
	CurlGlobal &operator=(const CurlGlobal &) = delete;
	CurlGlobal(CurlGlobal &&) = delete;
	CurlGlobal &operator=(CurlGlobal &&) = delete;
};

struct Services {
	OAuth2::OAuth2Config config;
	std::shared_ptr<OAuth2::CredentialStore> store;
	std::shared_ptr<OAuth2::ITokenEndpointClient> tokenEndpoint;
	std::shared_ptr<OAuth2::TokenLifecycleManager> tokenManager;
};

Services makeServices(const std::shared_ptr<const Logger::ILogger> &logger)
{
	const std::filesystem::path dir = App::configDirectory();

	Services services;
	services.config = OAuth2::OAuth2Config::load(dir / "config.json", *logger);
	services.store = std::make_shared<OAuth2::CredentialStore>(
		std::make_shared<OAuth2::JsonFileKeyValueStore>(dir / "auth.json"), logger);
	services.tokenEndpoint = std::make_shared<OAuth2::CurlTokenEndpointClient>(services.config, logger);
	services.tokenManager = std::make_shared<OAuth2::TokenLifecycleManager>(
		services.store, services.tokenEndpoint, logger, services.config.refreshMargin);
	return services;
}

int runLogin(const Services &services, const std::shared_ptr<const Logger::ILogger> &logger)
{
	auto listener = std::make_shared<CallbackServer::LoopbackCallbackListener>(
		CallbackServer::LoopbackCallbackListenerOptions::fromConfig(services.config), logger);
	OAuth2::AuthFlow flow(services.config, services.store, services.tokenEndpoint, listener, logger);

	const std::string url = flow.startFlow();
	fmt::print("Open the following URL in your browser to authorize access:\n\n{}\n\n", url);
	std::fflush(stdout);

	// The active flow is cleared once its code has been exchanged.
	while (flow.isListening() && flow.hasActiveFlow()) {
		std::this_thread::sleep_for(kLoginPollInterval);
	}

	if (!flow.hasActiveFlow() && services.tokenManager->getAuthStatus().authenticated) {
		fmt::print("Authorization complete.\n");
		return kExitSuccess;
	}

	fmt::print(stderr, "Authorization was not completed.\n");
	return kExitAuthError;
}

int runCommand(const std::vector<std::string_view> &args, const std::shared_ptr<const Logger::ILogger> &logger)
{
	const std::string_view command = args[0];
	const Services services = makeServices(logger);

	if (command == "configure") {
		if (args.size() != 3) {
			printUsage();
			return kExitUsage;
		}
		services.store->saveCredentials({std::string(args[1]), std::string(args[2])});
		fmt::print("Client credentials saved.\n");
		return kExitSuccess;
	}

	if (args.size() != 1) {
		printUsage();
		return kExitUsage;
	}

	if (command == "forget") {
		services.store->forgetCredentials();
		fmt::print("Credentials and tokens removed.\n");
		return kExitSuccess;
	} else if (command == "status") {
		const OAuth2::AuthStatus status = services.tokenManager->getAuthStatus();
		fmt::print("configured: {}\nauthenticated: {}\n", status.configured, status.authenticated);
		return kExitSuccess;
	} else if (command == "login") {
		return runLogin(services, logger);
	} else if (command == "token") {
		fmt::print("{}\n", services.tokenManager->getValidAccessToken());
		return kExitSuccess;
	} else if (command == "refresh") {
		services.tokenManager->refreshAccessToken();
		fmt::print("Access token refreshed.\n");
		return kExitSuccess;
	} else if (command == "logout") {
		services.tokenManager->logout();
		fmt::print("Logged out.\n");
		return kExitSuccess;
	}

	printUsage();
	return kExitUsage;
}

} // anonymous namespace

int main(int argc, char **argv)
{
	if (argc < 2) {
		printUsage();
		return kExitUsage;
	}

	const std::vector<std::string_view> args(argv + 1, argv + argc);
	const std::shared_ptr<const Logger::ILogger> logger = Logger::PrintLogger::instance();

	try {
		CurlGlobal curlGlobal;
		return runCommand(args, logger);
	} catch (const OAuth2::AuthError &e) {
		fmt::print(stderr, "Error: {}\n", e.what());
		return kExitAuthError;
	} catch (const std::invalid_argument &e) {
		fmt::print(stderr, "Error: {}\n", e.what());
		return kExitUsage;
	} catch (const std::exception &e) {
		fmt::print(stderr, "Error: {}\n", e.what());
		return kExitAuthError;
	}
}
