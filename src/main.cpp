#include "ControlFlow.hpp"

int main(int argc, char* argv[])
{
    ControlFlow App;
    return App.Run(argc, argv);
}
