#include "randstream/cli.hpp"

int main(int argc, char **argv) { return randstream::cli_main(argc, argv); }
