/**
 * @file main.cpp
 * @brief Entry point for phonegen
 */

#include <iostream>

#include "app/application.h"

/**
 * @brief Main entry point
 * @return Exit code (0 = success, non-zero = error)
 */
int main(int argc, char* argv[]) {
  auto app = phonegen::app::Application::Create(argc, argv);
  if (!app) {
    std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
    return 1;
  }

  return (*app)->Run();
}
