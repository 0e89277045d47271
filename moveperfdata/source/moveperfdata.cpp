#include "application.hpp"

int main(int argc, char *argv[])
{
	Application App{};
	return App.Run(argc, argv);
}
