#include "ModbusAdapter.hpp"
#include <edgebridge/Factory.hpp>

extern "C" {

edgebridge::IAdapter *create_adapter() {
    return new edgebridge::ModbusAdapter();
}

void destroy_adapter(edgebridge::IAdapter *adapter) {
    delete adapter;
}

} // extern "C"
