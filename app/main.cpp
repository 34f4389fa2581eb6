#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/log.hpp"
#include "io/config_io.hpp"
#include "io/result_formatter.hpp"
#include "io/store_io.hpp"
#include "optimizer/site_optimizer.hpp"

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "usage:\n"
            << "  " << argv0 << " optimize <request.json|-> [--envelope] [--config <config.json>]\n"
            << "  " << argv0 << " status [--config <config.json>]\n"
            << "\n"
            << "environment: H2SITE_DATA_DIR, H2SITE_FETCH_TIMEOUT_MS, H2SITE_LOG_LEVEL\n";
}

struct CliArgs {
  std::string command;
  std::string request_path;
  std::string config_path;
  bool envelope{false};
};

// false on malformed arguments
bool ParseArgs(int argc, char** argv, CliArgs& out) {
  if (argc < 2) return false;
  out.command = argv[1];

  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--envelope") {
      out.envelope = true;
    } else if (a == "--config") {
      if (i + 1 >= argc) return false;
      out.config_path = argv[++i];
    } else {
      positional.push_back(a);
    }
  }

  if (out.command == "optimize") {
    if (positional.size() != 1) return false;
    out.request_path = positional[0];
    return true;
  }
  if (out.command == "status") return positional.empty();
  return false;
}

std::string ReadRequestText(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  return h2site::io::StoreIO::ReadAllText(path);
}

} // namespace

int main(int argc, char** argv) {
  // 用法：
  //   ./h2site_cli optimize demo/request.json --config demo/config.json
  //   ./h2site_cli status --config demo/config.json
  // 不指定 --config 时使用内置默认参数（无数据目录 -> 降级模式）。
  CliArgs args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return 1;
  }

  try {
    // 1) 配置：文件 + 环境变量覆盖
    h2site::EngineConfig config;
    if (!args.config_path.empty()) config = h2site::io::ConfigIO::Load(args.config_path);
    h2site::io::ConfigIO::ApplyEnvironment(config);
    h2site::SetLogLevel(config.log_level);

    const h2site::SiteOptimizer optimizer = h2site::SiteOptimizer::FromConfig(config);

    if (args.command == "status") {
      std::cout << optimizer.Status().dump(2) << "\n";
      return 0;
    }

    // 2) 请求
    const nlohmann::json body =
        h2site::io::StoreIO::ParseJson(ReadRequestText(args.request_path), args.request_path);

    // 3) 计算 + 输出
    try {
      const nlohmann::json out =
          args.envelope ? h2site::io::ResultFormatter::Envelope(optimizer.Optimize(body)) : optimizer.Optimize(body);
      std::cout << out.dump(2) << "\n";
      return 0;
    } catch (const h2site::RequestError& e) {
      std::cout << h2site::io::ResultFormatter::Error(e.kind(), e.what()).dump(2) << "\n";
      return 2;
    }
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
