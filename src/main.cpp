#include "app/LookupCli.hpp"

#include <iostream>

int main(int argc, char** argv)
{
    return app::LookupCli{ argc, argv, std::cout, std::cerr }.run();
}
