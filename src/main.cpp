#include "net/proxy.hpp"
#include "hook/chain.hpp"
#include "hook/dump_addon.hpp"
#include "hook/kill_addon.hpp"
#include "hook/replace_addon.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

static uint16_t to_u16(const char* s) {
	char* end = nullptr;
	long v = std::strtol(s, &end, 10);
	if (*end != '\0' || v < 1 || v > 65535) throw std::runtime_error(std::string("port out of range: ") + s);
	return static_cast<uint16_t>(v);
}

static const char* need_value(int argc, char** argv, int& i) {
	if (i + 1 >= argc) throw std::runtime_error(std::string(argv[i]) + " needs a value");
	return argv[++i];
}

static void usage(const char* prog) {
	std::cerr << "Usage: " << prog << " [listen_port] [upstream_host] [upstream_port]"
	          << " [--quiet] [--replace FROM=TO] [--kill PATTERN]\n";
}

int main(int argc, char** argv) {
	ProxyConfig cfg;
	AddonChain chain;
	bool quiet = false;

	try {
		int positional = 0;
		for (int i = 1; i < argc; ++i) {
			if (std::strcmp(argv[i], "--quiet") == 0) {
				quiet = true;
			} else if (std::strcmp(argv[i], "--replace") == 0) {
				std::string rule = need_value(argc, argv, i);
				size_t eq = rule.find('=');
				if (eq == std::string::npos || eq == 0)
					throw std::runtime_error("--replace expects FROM=TO");
				chain.add(std::unique_ptr<Addon>(new ReplaceAddon(rule.substr(0, eq), rule.substr(eq + 1))));
			} else if (std::strcmp(argv[i], "--kill") == 0) {
				std::string pattern = need_value(argc, argv, i);
				if (pattern.empty()) throw std::runtime_error("--kill expects a pattern");
				chain.add(std::unique_ptr<Addon>(new KillAddon(pattern)));
			} else if (argv[i][0] == '-' && argv[i][1] == '-') {
				throw std::runtime_error(std::string("unknown option ") + argv[i]);
			} else {
				switch (positional++) {
					case 0: cfg.listen_port = to_u16(argv[i]); break;
					case 1: cfg.upstream_host = argv[i]; break;
					case 2: cfg.upstream_port = to_u16(argv[i]); break;
					default: throw std::runtime_error(std::string("unexpected argument ") + argv[i]);
				}
			}
		}
	} catch (const std::exception& e) {
		std::cerr << "Arg error: " << e.what() << "\n";
		usage(argv[0]);
		return 2;
	}

	// last, so it prints messages as the other addons left them
	if (!quiet)
		chain.add(std::unique_ptr<Addon>(new DumpAddon()));

	std::cout << "Listening on " << cfg.listen_host << ":" << cfg.listen_port
	          << " -> Upstream " << cfg.upstream_host << ":" << cfg.upstream_port
	          << " (" << chain.size() << " addons)\n";

	return run_epoll_proxy(cfg, chain);
}
