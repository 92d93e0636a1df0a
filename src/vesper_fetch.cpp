// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <vesper/vesper.hpp>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

struct FetchOptions
{
  std::optional<std::string> configFile;
  std::string method{"GET"};
  std::optional<std::string> data;
  std::vector<std::pair<std::string, std::string>> headers;
  std::optional<double> timeout;
  std::optional<std::string> logLevel;
  bool insecure{false};
  bool headersOnly{false};
  std::string url;
};

/// \brief Print help message
void printHelp()
{
  std::cout << "Usage: vesper_fetch [options] URL\n"
            << "  -h, --help                 Show this help message\n"
            << "  -c, --config <file>        Configuration file path (TOML)\n"
            << "  -X, --method <method>      GET, POST or PUT (default: GET)\n"
            << "  -d, --data <body>          Raw request body\n"
            << "  -H, --header <line>        Extra header, \"Name: value\"; repeatable\n"
            << "  -t, --timeout <seconds>    Request timeout\n"
            << "  -l, --log-level <level>    Log level (trace, debug, info, warning, "
               "error, fatal)\n"
            << "  -k, --insecure             Do not verify the TLS peer\n"
            << "  -I, --head-only            Print status and headers only\n";
}

/// \brief Parse command-line arguments
/// \return std::nullopt when help was requested.
std::optional<FetchOptions> parseCliArgs(int argc, char** argv)
{
  FetchOptions options;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc)
    {
      options.configFile = argv[++i];
    }
    else if ((arg == "-X" || arg == "--method") && i + 1 < argc)
    {
      options.method = argv[++i];
    }
    else if ((arg == "-d" || arg == "--data") && i + 1 < argc)
    {
      options.data = argv[++i];
    }
    else if ((arg == "-H" || arg == "--header") && i + 1 < argc)
    {
      std::string line = argv[++i];
      auto colon = line.find(':');
      if (colon == std::string::npos)
      {
        throw std::runtime_error("Invalid header, expected \"Name: value\": " + line);
      }
      auto valueStart = line.find_first_not_of(" \t", colon + 1);
      options.headers.emplace_back(line.substr(0, colon), valueStart == std::string::npos
                                                            ? std::string()
                                                            : line.substr(valueStart));
    }
    else if ((arg == "-t" || arg == "--timeout") && i + 1 < argc)
    {
      try
      {
        options.timeout = std::stod(argv[++i]);
      }
      catch (const std::exception&)
      {
        throw std::runtime_error("Invalid timeout: " + std::string(argv[i]));
      }
    }
    else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
    {
      options.logLevel = argv[++i];
    }
    else if (arg == "-k" || arg == "--insecure")
    {
      options.insecure = true;
    }
    else if (arg == "-I" || arg == "--head-only")
    {
      options.headersOnly = true;
    }
    else if (arg == "-h" || arg == "--help")
    {
      printHelp();
      return std::nullopt;
    }
    else if (arg.length() > 0 && arg[0] == '-')
    {
      throw std::runtime_error("Unknown option: " + arg);
    }
    else if (options.url.empty())
    {
      options.url = arg;
    }
    else
    {
      throw std::runtime_error("Unexpected argument: " + arg);
    }
  }
  if (options.url.empty())
  {
    throw std::runtime_error("Missing URL");
  }
  return options;
}

} // namespace

int main(int argc, char** argv)
{
  using namespace vesper;

  std::optional<FetchOptions> options;
  core::ClientConfig config;
  try
  {
    options = parseCliArgs(argc, argv);
    if (!options)
    {
      return 0;
    }
    if (options->configFile)
    {
      config = core::ClientConfig::fromFile(*options->configFile);
    }
    if (options->logLevel)
    {
      config.log.level = options->logLevel;
    }
    if (options->insecure)
    {
      config.tls.verifyPeer = false;
    }
    if (!config.log.level)
    {
      config.log.level = "warning";
    }
    config.applyLogging();
  }
  catch (const std::exception& e)
  {
    std::cerr << "vesper_fetch: " << e.what() << "\n";
    printHelp();
    return 2;
  }

  int exitCode = 0;
  try
  {
    network::HttpClient client(config);
    auto request = client.newRequest(options->url);
    request.setMethod(options->method);
    if (options->data)
    {
      request.setData(*options->data);
    }
    if (options->timeout)
    {
      request.setTimeout(*options->timeout);
    }
    for (const auto& [name, value] : options->headers)
    {
      request.addHeader(name, value);
    }

    auto future = client.submit(request);
    const auto& response = future.resolve();

    std::cout << response.status.describe() << "\n";
    for (const auto& header : response.headers)
    {
      std::cout << header.name;
      if (header.value)
      {
        std::cout << ": " << *header.value;
      }
      std::cout << "\n";
    }
    if (!options->headersOnly)
    {
      std::cout << "\n" << response.body;
      if (!response.body.empty() && response.body.back() != '\n')
      {
        std::cout << "\n";
      }
    }
    exitCode = response.status.isError() ? 1 : 0;
  }
  catch (const network::ConfigurationError& e)
  {
    std::cerr << "vesper_fetch: " << e.what() << "\n";
    exitCode = 2;
  }
  catch (const std::exception& e)
  {
    VESPER_LOG_ERROR("vesper_fetch: " << e.what());
    exitCode = 2;
  }

  core::Logger::shutdown();
  return exitCode;
}
