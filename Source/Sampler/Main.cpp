#include <Circa/Core/Arguments.hpp>
#include <Circa/Core/ConVar.hpp>
#include <Circa/Core/Log.hpp>
#include <Circa/Util/SampleWindow.hpp>
#include <iostream>

using namespace circa;

int main(int argc, char** argv)
{
    Arguments::parseArguments(argc, argv);
    initLogging(Arguments::hasArgument("verbose"));
    ConVar::applyArguments();

    return runSampler(std::cin, std::cout);
}
