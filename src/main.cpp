#include "speed_app.hpp"

int main(const int argc, char *argv[]) {
    return orbit::runSpeedApplication(argc, argv);
}
