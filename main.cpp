#include"Cli/Main.hpp"
#include<iostream>
#include<memory>
#include<string>
#include<vector>

int main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i) {
		arg_vec.push_back(std::string(argv[i]));
	}
	auto main_obj = std::make_shared<Cli::Main>(
		arg_vec, std::cin, std::cout, std::cerr
	);
	return main_obj->run();
}
