#include <svcman/app.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>

int main(int argc, char** argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (const char* lvl = std::getenv("SVCMAN_LOG_LEVEL"))
    spdlog::set_level(spdlog::level::from_str(lvl));
  return svcman::App{}.run(argc, argv);
}
