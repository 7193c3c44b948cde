// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// imgdrop - upload images to a storage endpoint and print their links

#include <exception>
#include <iostream>

#include "commands.hpp"

int main(int argc, char* argv[]) {
  imgdrop::cli::Commands commands;

  try {
    return commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
