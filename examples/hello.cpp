#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <format>
#include <iostream>
#include <stdexcept>
#include <star/star.hpp>
#include <string>
#include <utility>

#include "star/log.hpp"

using namespace star;

int main(int argc, char **argv) {
  uint16_t port = 8000;
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << "\n";
      return EXIT_FAILURE;
    }
  }

  log::set_level(log::level::info);

  // Enable signal handler for graceful shutdown on Ctrl+C
  SignalHandler::Enable();

  try {
    // An error page template may be given through STAR_ERROR_TEMPLATE, e.g. examples/templates/error.html
    RouterConfig routerConfig;
    if (const char *errorTemplate = std::getenv("STAR_ERROR_TEMPLATE"); errorTemplate != nullptr) {
      routerConfig.withErrorPageTemplatePath(errorTemplate);
    }

    Router router(std::move(routerConfig));

    router.get("/", [](const RequestSnapshot &) { return std::string("<h1>Hello from star!</h1>"); });

    router.route("/hello/<name>", {"GET", "POST"}, PositionalHandler<std::string>([](const std::string &name) {
                   return std::format("<h1>Hello, {}!</h1>", name);
                 }));

    router.get("/user/<int:id>", PositionalHandler<int64_t>([](int64_t id) {
                 return std::format("<p>User #{}</p>", id);
               }));

    router.get("/price/<float:amount>", PositionalHandler<double>([](double amount) {
                 return std::format("<p>Price with tax: {:.2f}</p>", amount * 1.2);
               }));

    router.get("/search", [](const RequestSnapshot &snapshot) {
      return std::format("<p>Searching for '{}'</p>", snapshot.queryArg("q").value_or(""));
    });

    router.get("/fail", [](const RequestSnapshot &) -> std::string { throw std::runtime_error("Something broke"); });

    HttpServer server(HttpServerConfig{}.withPort(port), std::move(router));
    server.run();  // blocking run, until Ctrl+C
  } catch (const std::exception &e) {
    std::cerr << "Server encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
