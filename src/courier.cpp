// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Courier, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#include <courier/courier.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

  /// \brief Command line settings. Unset values fall back to the config
  /// file, then to built-in defaults.
  struct CliConfig
  {
    std::optional<std::string> configFile;
    std::optional<int> parallel;
    std::string method = "GET";
    std::optional<std::string> data;
    std::optional<std::string> redirects;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<std::string> logFormat;
    std::vector<std::string> urls;
  };

  /// \brief Print help message
  void printHelp()
  {
    std::cout << "Usage: courier [options] URL...\n"
              << "  -h, --help                 Show this help message\n"
              << "  -c, --config <file>        JSON configuration file\n"
              << "  -p, --parallel <n>         Transfers in flight for several URLs "
                 "(default: 50)\n"
              << "  -X, --method <method>      Request method (default: GET)\n"
              << "  -d, --data <body>          Request body\n"
              << "      --no-redirects         Do not follow redirects\n"
              << "      --strict-redirects     Keep method and body when redirected\n"
              << "  -l, --log-level <level>    Log level (trace, debug, info, "
                 "warning, error, fatal)\n"
              << "  -f, --log-file <file>      Log file path\n";
  }

  int parseInt(const std::string& value, const std::string& what)
  {
    try
    {
      return std::stoi(value);
    }
    catch (const std::exception&)
    {
      throw std::runtime_error("Invalid " + what + ": " + value);
    }
  }

  /// \brief Parse command-line arguments into the CLI config
  void parseCliArgs(int argc, char** argv, CliConfig& config,
                    std::unique_ptr<courier::core::ConfigLoader>& configLoader)
  {
    for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      if ((arg == "-c" || arg == "--config") && i + 1 < argc)
      {
        config.configFile = argv[++i];
        configLoader = std::make_unique<courier::core::ConfigLoader>(*config.configFile);
      }
      else if ((arg == "-p" || arg == "--parallel") && i + 1 < argc)
      {
        config.parallel = parseInt(argv[++i], "parallel value");
      }
      else if ((arg == "-X" || arg == "--method") && i + 1 < argc)
      {
        config.method = argv[++i];
      }
      else if ((arg == "-d" || arg == "--data") && i + 1 < argc)
      {
        config.data = argv[++i];
      }
      else if (arg == "--no-redirects")
      {
        config.redirects = "none";
      }
      else if (arg == "--strict-redirects")
      {
        config.redirects = "strict";
      }
      else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc)
      {
        config.logLevel = argv[++i];
      }
      else if ((arg == "-f" || arg == "--log-file") && i + 1 < argc)
      {
        config.logFile = argv[++i];
      }
      else if (arg == "-h" || arg == "--help")
      {
        printHelp();
        std::exit(0);
      }
      else if (arg.length() > 0 && arg[0] == '-')
      {
        throw std::runtime_error("Unknown option: " + arg);
      }
      else
      {
        config.urls.push_back(arg);
      }
    }
  }

  /// \brief Fill unset CLI values from the JSON configuration file
  void parseJsonConfig(CliConfig& config, std::unique_ptr<courier::core::ConfigLoader>& configLoader)
  {
    if (!configLoader)
    {
      std::ifstream probe(COURIER_DEFAULT_CONFIG_FILE_PATH);
      if (!probe.good())
      {
        return;
      }
      configLoader =
          std::make_unique<courier::core::ConfigLoader>(COURIER_DEFAULT_CONFIG_FILE_PATH);
    }
    if (!config.parallel)
    {
      if (auto parallel = configLoader->getInt("parallel"))
      {
        config.parallel = static_cast<int>(*parallel);
      }
    }
    if (!config.logLevel)
    {
      config.logLevel = configLoader->getString("log.level");
    }
    if (!config.logFile)
    {
      config.logFile = configLoader->getString("log.file");
    }
    if (!config.logFormat)
    {
      config.logFormat = configLoader->getString("log.format");
    }
  }

  courier::core::Json buildRequestOptions(const CliConfig& config)
  {
    courier::core::Json options = courier::core::Json::object();
    if (config.data)
    {
      options["body"] = *config.data;
    }
    if (config.redirects == std::optional<std::string>("none"))
    {
      options["allow_redirects"] = false;
    }
    else if (config.redirects == std::optional<std::string>("strict"))
    {
      options["allow_redirects"] = "strict";
    }
    return options;
  }

  int sendOne(courier::Client& client, const CliConfig& config)
  {
    auto request =
        client.createRequest(config.method, config.urls.front(), buildRequestOptions(config));
    try
    {
      auto response = client.send(request);
      std::cout << response->toString() << std::endl;
      return response->isSuccess() ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const courier::RequestError& e)
    {
      std::cerr << "Request failed: " << e.what() << std::endl;
      if (e.hasResponse())
      {
        std::cout << e.getResponse()->toString() << std::endl;
      }
      return EXIT_FAILURE;
    }
  }

  int sendBatch(courier::Client& client, const CliConfig& config)
  {
    std::vector<courier::RequestPtr> requests;
    auto options = buildRequestOptions(config);
    // Failures are reported per URL instead of aborting the batch
    options["exceptions"] = false;
    for (const auto& url : config.urls)
    {
      requests.push_back(client.createRequest(config.method, url, options));
    }

    int failures = 0;
    courier::adapter::SendAllOptions batch;
    batch.parallel = config.parallel.value_or(batch.parallel);
    batch.after = [](courier::event::AfterSendEvent& e)
    {
      std::cout << e.getResponse()->getStatusCode() << " " << e.getRequest()->getUrl()
                << std::endl;
    };
    batch.error = [&failures](courier::event::ErrorEvent& e)
    {
      ++failures;
      std::cout << "ERROR " << e.getRequest()->getUrl() << ": " << e.getMessage() << std::endl;
    };
    batch.priority = courier::event::RequestEvents::LATE;
    client.sendAll(std::move(requests), batch);
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

} // namespace

int main(int argc, char** argv)
{
  try
  {
    std::unique_ptr<courier::core::ConfigLoader> configLoader;
    CliConfig config;
    parseCliArgs(argc, argv, config, configLoader);
    parseJsonConfig(config, configLoader);

    courier::core::Logger::init(
        courier::core::Logger::levelFromString(config.logLevel.value_or("warning")),
        config.logFile.value_or(""));
    if (config.logFormat)
    {
      courier::core::Logger::setLogFormat(*config.logFormat);
    }

    if (config.urls.empty())
    {
      printHelp();
      return EXIT_FAILURE;
    }

    courier::Client::Config clientConfig;
    if (configLoader)
    {
      clientConfig = courier::Client::Config::fromJson(configLoader->table());
      COURIER_LOG_INFO("Using config file: " << config.configFile.value_or(
                           COURIER_DEFAULT_CONFIG_FILE_PATH));
    }
    courier::Client client(clientConfig);

    if (config.urls.size() == 1)
    {
      return sendOne(client, config);
    }
    return sendBatch(client, config);
  }
  catch (const std::exception& ex)
  {
    std::cerr << "courier: " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
}
