// Minimal example
#include <iostream>

#include "backdrop_sdk.h"

int main() {
    std::cout << "BackdropSDK v" << backdrop_sdk::get_version() << std::endl;
    return 0;
}
