#include "games/tictactoe/ConsoleGame.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    tictactoe::ConsoleGame::Params game_params;
    util::Logging::Params log_params;

    po::options_description desc("General options");
    desc.add_options()("help,h", "help");
    desc.add(game_params.make_options_description()).add(log_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);

    tictactoe::ConsoleGame game(game_params);
    game.run();
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
