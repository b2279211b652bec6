#include <string>
#include <vector>

#include "app/HabitPointsApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    habitpoints::app::HabitPointsApp app;
    return app.Run(args);
}
