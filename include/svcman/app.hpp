#pragma once

namespace svcman {

struct App {
  int run(int argc, char **argv);
};

} // namespace svcman
