#include "FrameAdapter.hpp"
#include <edgebridge/Factory.hpp>

extern "C" {

edgebridge::IAdapter *create_adapter() {
    return new edgebridge::FrameAdapter();
}

void destroy_adapter(edgebridge::IAdapter *adapter) {
    delete adapter;
}

} // extern "C"
