#include <uidinit/app.hpp>

int main(int argc, char **argv) { return uidinit::App{}.run(argc, argv); }
