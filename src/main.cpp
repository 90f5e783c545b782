
#include "sc_cli.hpp"

int main(int argc, char** argv)
{
	return sc_cli_run(argc, argv);
}
