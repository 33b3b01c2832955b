#include <shadertree/project/project.hpp>

int main(int argc, char **argv) {
    return st::run_project_main(argc, argv);
}
