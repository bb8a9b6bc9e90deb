#include "cli.hpp"

#include <cstdio>
#include <iostream>

int main(int argc, char* argv[])
{
    return run_cli(argc, argv, std::cin, stdout, stderr);
}
