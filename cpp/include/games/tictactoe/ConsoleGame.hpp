#pragma once

#include "games/tictactoe/GameEngine.hpp"
#include "games/tictactoe/GameState.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace tictactoe {

/*
 * Interactive two-player console front-end for GameEngine.
 *
 * Reads the board size (unless given via Params), then plays games until the user declines to play
 * again or input runs out. All prompts go to the output stream and all answers come from the input
 * stream, so the loop can be driven by string streams.
 */
class ConsoleGame {
 public:
  static constexpr int kPromptForBoardSize = 0;

  struct Params {
    int board_size = kPromptForBoardSize;
    bool clear_screen;

    Params();
    boost::program_options::options_description make_options_description();
  };

  ConsoleGame(const Params& params, std::istream& in = std::cin, std::ostream& out = std::cout);

  /*
   * Returns the number of games that reached a terminal phase.
   *
   * Throws InvalidConfiguration if Params::board_size is set but out of range.
   */
  int run();

 private:
  std::optional<int> prompt_board_size();

  // Returns false if the input ran out before the game ended.
  bool play_game(int board_size);

  bool prompt_play_again();

  // Writes prompt, then reads a line into line. Returns false on end of input.
  bool prompt_line(const std::string& prompt, std::string& line);

  void announce_result(const GameState& state);

  const Params params_;
  std::istream& in_;
  std::ostream& out_;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/ConsoleGame.inl"
