// Local headers
#include "fitsmeta/cli.hxx"

// Standard library
#include <exception>
#include <iostream>

int main(int argc, char const* const* argv) {
    try {
        return fitsmeta::run(argc, argv, std::cout, std::cerr);
    } catch (std::exception const& ex) {
        std::cerr << "fitsmeta: " << ex.what() << std::endl;
    }
    return 1;
}
