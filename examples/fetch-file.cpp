#include <cstdlib>
#include <exception>
#include <filefetch/filefetch.hpp>
#include <filefetch/log.hpp>
#include <iostream>
#include <string_view>
#include <utility>

namespace {

void Usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <locator> [--encoding <name>] [--no-parent] [--verbose]\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::string_view locator;
  filefetch::FileProtocolConfig config;

  for (int argPos = 1; argPos < argc; ++argPos) {
    const std::string_view arg(argv[argPos]);
    if (arg == "--encoding" && argPos + 1 < argc) {
      config.withCharacterEncoding(argv[++argPos]);
    } else if (arg == "--no-parent") {
      config.withCrawlParent(false);
    } else if (arg == "--verbose") {
      filefetch::log::set_level(filefetch::log::level::debug);
    } else if (locator.empty() && !arg.starts_with("--")) {
      locator = arg;
    } else {
      Usage(argv[0]);
      return EXIT_FAILURE;
    }
  }
  if (locator.empty()) {
    Usage(argv[0]);
    return EXIT_FAILURE;
  }

  try {
    const filefetch::FileProtocol protocol(std::move(config));

    filefetch::Metadata metadata;
    const filefetch::ProtocolResponse response = protocol.getProtocolOutput(locator, metadata);

    std::cout << response.statusCode() << ' ' << filefetch::http::ReasonPhrase(response.statusCode()) << '\n';
    for (const auto& [key, values] : response.metadata()) {
      for (const auto& value : values) {
        std::cout << key << ": " << value << '\n';
      }
    }
    std::cout << '\n';
    std::cout.write(response.content().data(), static_cast<std::streamsize>(response.content().size()));
    std::cout.flush();
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
