#include "app/RetentionMain.hpp"

int main(int argc, char *argv[])
{
    return sw::app::retention_main(argc, argv);
}
