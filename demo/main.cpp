#include "demo/DemoApp.hpp"

int main()
{
    boxui::demo::DemoApp app;
    return app.Run() ? 0 : 1;
}
