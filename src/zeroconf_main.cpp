#include "Application.hpp"

// Same daemon, multicast DNS backend by default
int main(int argc, char** argv) {
    return discovery::runDiscoveryNode(argc, argv, discovery::BackendKind::ZEROCONF);
}
