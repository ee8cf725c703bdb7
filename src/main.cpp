#include <iostream>
#include <exception>

#include "query_app.hpp"

int main(int argc, char* argv[]) {
    try {
        splatquery::QueryApp app(argc, argv);
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
