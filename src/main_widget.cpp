#include "app/AppMain.hpp"

int main(int argc, char *argv[])
{
    return zf::app::widget_main(argc, argv);
}
