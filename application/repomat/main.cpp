#include <repomat/app.hpp>

int main(int argc, char **argv) { return repomat::App{}.run(argc, argv); }
