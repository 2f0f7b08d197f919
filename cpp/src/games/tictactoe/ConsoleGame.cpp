#include "games/tictactoe/ConsoleGame.hpp"

#include "games/tictactoe/IO.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/ScreenUtil.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

namespace tictactoe {

ConsoleGame::ConsoleGame(const Params& params, std::istream& in, std::ostream& out)
    : params_(params), in_(in), out_(out) {}

int ConsoleGame::run() {
  int board_size = params_.board_size;
  if (board_size == kPromptForBoardSize) {
    std::optional<int> size = prompt_board_size();
    if (!size) return 0;
    board_size = *size;
  } else {
    GameEngine::validate_board_dimension(board_size);
  }

  int num_games = 0;
  while (true) {
    if (!play_game(board_size)) break;
    num_games++;
    if (!prompt_play_again()) break;
  }
  LOG_INFO("Session over after {} completed game(s)", num_games);
  return num_games;
}

std::optional<int> ConsoleGame::prompt_board_size() {
  std::string line;
  while (prompt_line("Select board size: ", line)) {
    std::optional<int> size = IO::parse_board_size(line);
    if (!size) {
      out_ << "Invalid input! Please enter a number between " << kMinBoardDimension << " and "
           << kMaxBoardDimension << "." << std::endl;
      continue;
    }
    try {
      GameEngine::validate_board_dimension(*size);
    } catch (const InvalidConfiguration& e) {
      out_ << e.what() << ". Try again." << std::endl;
      continue;
    }
    return size;
  }
  return std::nullopt;
}

bool ConsoleGame::play_game(int board_size) {
  GameEngine engine(board_size);
  LOG_INFO("Starting a {}x{} game", board_size, board_size);

  if (params_.clear_screen) {
    try {
      util::clearscreen();
    } catch (const util::Exception& e) {
      LOG_WARN("{}", e.what());
    }
  }

  std::string line;
  while (true) {
    const GameState& state = engine.current_state();
    IO::print_state(out_, state);

    if (is_terminal(state.phase)) {
      announce_result(state);
      return true;
    }

    std::string player = IO::player_to_str(state.active_player);
    if (!prompt_line(fmt::format("Player {}'s turn (column+row): ", player), line)) {
      LOG_INFO("Input ended during a game in progress");
      return false;
    }

    std::optional<Move> move = IO::parse_move(line);
    if (!move) {
      LOG_DEBUG("Malformed move input from {}: \"{}\"", player, line);
      out_ << "Invalid input! Please enter column and row (e.g., 12)" << std::endl;
      continue;
    }

    MoveResult result = engine.apply_move(*move);
    if (!result.ok()) {
      LOG_DEBUG("Rejected move by {} at ({}, {}): {}", player, move->row, move->col,
                IO::status_to_str(result.status));
      out_ << "Invalid move! " << IO::status_to_str(result.status) << ". Try again." << std::endl;
      continue;
    }
    LOG_DEBUG("{} played ({}, {})", player, move->row, move->col);
  }
}

bool ConsoleGame::prompt_play_again() {
  std::string line;
  if (!prompt_line("\nPlay again? (y/n): ", line)) return false;

  std::string answer = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line));
  return answer.empty() || answer == "y";
}

bool ConsoleGame::prompt_line(const std::string& prompt, std::string& line) {
  out_ << prompt;
  out_.flush();
  if (!std::getline(in_, line)) {
    out_ << std::endl;
    return false;
  }
  return true;
}

void ConsoleGame::announce_result(const GameState& state) {
  LOG_INFO("Game over: {}", IO::phase_to_str(state.phase));

  if (const Won* won = std::get_if<Won>(&state.phase)) {
    out_ << "Player " << IO::player_to_str(won->player) << " wins!" << std::endl;
  } else {
    out_ << "It's a tie!" << std::endl;
  }
}

}  // namespace tictactoe
