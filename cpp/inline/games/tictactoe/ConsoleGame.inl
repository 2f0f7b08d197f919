#include "games/tictactoe/ConsoleGame.hpp"

#include "games/tictactoe/Constants.hpp"
#include "util/BoostUtil.hpp"
#include "util/Rendering.hpp"

#include <boost/program_options.hpp>

#include <string>

namespace tictactoe {

inline ConsoleGame::Params::Params()
    : clear_screen(util::Rendering::mode() == util::Rendering::kTerminal) {}

inline boost::program_options::options_description ConsoleGame::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po::options_description desc("Game options");

  std::string board_size_help = "board size, between " + std::to_string(kMinBoardDimension) +
                                " and " + std::to_string(kMaxBoardDimension) +
                                ". If omitted, the size is prompted for";
  desc.add_options()("board-size,n", po::value<int>(&board_size), board_size_help.c_str());
  po2::add_flag(desc, "clear-screen", "no-clear-screen", &clear_screen,
                "clear the screen at the start of each game", "never clear the screen");
  return desc;
}

}  // namespace tictactoe
