#pragma once
#include "app/DashboardController.hpp"

// Full-screen ftxui front end. Draws the controller state every frame and
// forwards key presses to it; fetch completions wake the loop through a
// posted custom event.
class DashboardUI {
public:
    explicit DashboardUI(DashboardController& controller);

    // Interactive loop (blocks until the controller requests quit)
    void run();

private:
    DashboardController& controller_;

    static constexpr int kFilterListWidth = 32;
};
