#pragma once

// Entry point of footpack_cli, kept out of main.cpp so tests and other
// front-ends can drive the same dispatcher.
//
// Implementation: src/cli/CliMain.cpp

namespace footpack {

int FootPackCliMain(int argc, char** argv);

} // namespace footpack
