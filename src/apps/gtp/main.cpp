#include "gtp/gtpEngine.hpp"

#include <iostream>
#include <string>

int main(int, char**) {
	hoshi::gtp::GtpEngine engine;

	// Serve commands until stdin closes or quit is received.
	std::string line;
	while (!engine.quitRequested() && std::getline(std::cin, line)) {
		std::cout << engine.handle(line) << std::flush;
	}

	return 0;
}
