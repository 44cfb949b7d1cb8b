// Copyright (c) 2025 Zoe Gates <zoe@zeocities.dev>

#include "app/application.hpp"
#include "vantage/log.hpp"

int main(int argc, char* argv[]) {
  vantage::log::apply_environment();
  vantage::log::info("Vantage starting");
  auto app = vantage::app::Application::create();
  return app->run(argc, argv);
}
