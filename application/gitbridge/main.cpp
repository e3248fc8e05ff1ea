#include <gitbridge/app.hpp>

int main(int argc, char **argv) { return gitbridge::App{}.run(argc, argv); }
