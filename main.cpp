#include "app/ContextWalletApp.hpp"

int main(int argc, char** argv) {
    contextwallet::app::ContextWalletApp app;
    return app.Run(argc, argv);
}
