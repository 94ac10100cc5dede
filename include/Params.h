#pragma once

#include <inttypes.h>
#include <string.h>

#include <cstdlib>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "GridTypes.h"

struct RunParams {
  std::string grid_file;                   // text grid, overrides geometry
  int64_t rows = 10;                       // grid height
  int64_t cols = 10;                       // grid width
  AIF::Position start = {0, 0};            // start cell
  AIF::Position goal = {9, 9};             // goal cell
  std::vector<AIF::Position> obstacles;    // obstacle cells
  int64_t max_steps = 100;                 // episode step budget
  double exploration_rate = 0.1;           // random action probability
  uint64_t seed = std::random_device{}();  // agent random seed
  int64_t stall_limit = 0;                 // consecutive blocked steps, 0 off
  bool render = false;                     // draw the belief every step
  std::string belief_csv;                  // final belief output file
  std::string path_csv;                    // path history output file
  std::string optimal_csv;                 // shortest route output file
  int64_t n_eval_trials = 0;               // num trials for evaluation
};

AIF::Position parsePosition(const std::string& s) {
  std::stringstream ss(s);
  AIF::Position pos;
  char sep = 0;
  if (!(ss >> pos.row >> sep >> pos.col) || sep != ',' || !ss.eof())
    throw std::invalid_argument("Invalid cell '" + s + "', expected row,col");
  return pos;
}

std::vector<AIF::Position> parsePositionList(const std::string& s) {
  std::vector<AIF::Position> cells;
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, ';'))
    if (!item.empty()) cells.push_back(parsePosition(item));
  return cells;
}

RunParams parseArgs(int argc, char** argv) {
  RunParams params;
  std::stringstream ss;
  ss << "Usage: " << argv[0] << " [options]\n"
     << "Options:\n"
     << "  --grid_file <path>                Text grid ('#' obstacle, '.' "
        "free, 'S' start, 'G' goal)\n"
     << "  --rows <int64_t>                  Grid height\n"
     << "  --cols <int64_t>                  Grid width\n"
     << "  --start <row,col>                 Start cell\n"
     << "  --goal <row,col>                  Goal cell\n"
     << "  --obstacles <r,c;r,c;...>         Obstacle cells\n"
     << "  --max_steps <int64_t>             Episode step budget\n"
     << "  --exploration_rate <double>       Probability of a random "
        "action\n"
     << "  --seed <uint64_t>                 Random seed\n"
     << "  --stall_limit <int64_t>           Stop after this many "
        "consecutive blocked steps (0 disables)\n"
     << "  --render                          Draw the belief after every "
        "step\n"
     << "  --belief_csv <path>               Write the final belief as CSV\n"
     << "  --path_csv <path>                 Write the path history as CSV\n"
     << "  --optimal_csv <path>              Write a shortest route as CSV\n"
     << "  --n_eval_trials <int64_t>         Number of trials for "
        "evaluation\n"
     << "  --help                            Show this help message\n";

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--grid_file") == 0 && i + 1 < argc) {
      params.grid_file = argv[++i];
    } else if (strcmp(argv[i], "--rows") == 0 && i + 1 < argc) {
      params.rows = std::stoll(argv[++i]);
    } else if (strcmp(argv[i], "--cols") == 0 && i + 1 < argc) {
      params.cols = std::stoll(argv[++i]);
    } else if (strcmp(argv[i], "--start") == 0 && i + 1 < argc) {
      params.start = parsePosition(argv[++i]);
    } else if (strcmp(argv[i], "--goal") == 0 && i + 1 < argc) {
      params.goal = parsePosition(argv[++i]);
    } else if (strcmp(argv[i], "--obstacles") == 0 && i + 1 < argc) {
      params.obstacles = parsePositionList(argv[++i]);
    } else if (strcmp(argv[i], "--max_steps") == 0 && i + 1 < argc) {
      params.max_steps = std::stoll(argv[++i]);
    } else if (strcmp(argv[i], "--exploration_rate") == 0 && i + 1 < argc) {
      params.exploration_rate = std::stod(argv[++i]);
    } else if (strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
      params.seed = std::stoull(argv[++i]);
    } else if (strcmp(argv[i], "--stall_limit") == 0 && i + 1 < argc) {
      params.stall_limit = std::stoll(argv[++i]);
    } else if (strcmp(argv[i], "--render") == 0) {
      params.render = true;
    } else if (strcmp(argv[i], "--belief_csv") == 0 && i + 1 < argc) {
      params.belief_csv = argv[++i];
    } else if (strcmp(argv[i], "--path_csv") == 0 && i + 1 < argc) {
      params.path_csv = argv[++i];
    } else if (strcmp(argv[i], "--optimal_csv") == 0 && i + 1 < argc) {
      params.optimal_csv = argv[++i];
    } else if (strcmp(argv[i], "--n_eval_trials") == 0 && i + 1 < argc) {
      params.n_eval_trials = std::stoll(argv[++i]);
    } else if (strcmp(argv[i], "--help") == 0) {
      std::cout << ss.str();
      std::exit(0);
    } else {
      std::cerr << "Error: Unknown or incomplete option " << argv[i] << "\n";
      std::cerr << ss.str();
      std::exit(1);
    }
  }

  return params;
}
