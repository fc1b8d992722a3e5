#include "Application.hpp"

int main(int argc, char** argv) {
    return discovery::runDiscoveryNode(argc, argv, discovery::BackendKind::HEARTBEAT);
}
