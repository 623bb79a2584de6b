#include "macaroon-tool.hpp"

#include <iostream>


int
main(int argc, char** argv)
{
  macaroon::tool::MacaroonTool tool(argv[0], std::cin, std::cout, std::cerr);
  return tool.main(std::vector<std::string>(argv + 1, argv + argc));
}
