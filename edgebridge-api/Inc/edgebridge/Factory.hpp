#pragma once

namespace edgebridge { class IAdapter; } // 前向声明

extern "C" {
	/** 工厂函数，创建适配器实例 */
	edgebridge::IAdapter *create_adapter();
	/** 工厂函数，销毁适配器实例 */
	void destroy_adapter(edgebridge::IAdapter *adapter);
}
