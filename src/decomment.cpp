#include "decomment.hpp"

int main(int argc, const char** argv)
{
	return decomment::run(std::span<const char*>(argv + 1, argc - 1));
}
