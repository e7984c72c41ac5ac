#include "cli/CliMain.hpp"

int main(int argc, char** argv)
{
  return footpack::FootPackCliMain(argc, argv);
}
