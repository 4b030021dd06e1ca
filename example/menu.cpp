#include <iostream>

#include "sflaunch.hpp"
#include "sfmenu.hpp"

int main(int argc, char** argv) {
  sfib::launch(argc, argv, [&] {
    sfib::menu m(std::cin, std::cout);
    m.run();
  });
  return 0;
}
