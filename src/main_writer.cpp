#include "app/AppMain.hpp"

int main(int argc, char *argv[])
{
    return zf::app::writer_main(argc, argv);
}
