#include "ogmo/core/Logger.hpp"

#include <catch2/catch_session.hpp>

int main(int argc, char* argv[]) {
    Catch::Session session;
    int returnCode = session.applyCommandLine(argc, argv);
    if (returnCode != 0) {
        return returnCode;
    }

    // Decoder warnings are expected by several tests; listeners still see them.
    ogmo::core::Logger::SetConsoleEnabled(false);
    return session.run();
}
