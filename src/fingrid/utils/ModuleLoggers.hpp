#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 设置为 1 输出逐单元格的求值跟踪日志（量大，默认关闭）
#ifndef FINGRID_ENABLE_EVAL_TRACE
#define FINGRID_ENABLE_EVAL_TRACE 0
#endif

// 核心模块 (core)
#define CORE_TRACE(...)    FINGRID_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    FINGRID_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     FINGRID_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     FINGRID_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    FINGRID_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 公式模块 (formula)
#define FORMULA_DEBUG(...) FINGRID_LOG_DEBUG("[DBG][fmla] " __VA_ARGS__)
#define FORMULA_INFO(...)  FINGRID_LOG_INFO("[INF][fmla] " __VA_ARGS__)
#define FORMULA_WARN(...)  FINGRID_LOG_WARN("[WRN][fmla] " __VA_ARGS__)
#define FORMULA_ERROR(...) FINGRID_LOG_ERROR("[ERR][fmla] " __VA_ARGS__)

// 重算模块 (calc)
#define CALC_DEBUG(...)    FINGRID_LOG_DEBUG("[DBG][calc] " __VA_ARGS__)
#define CALC_INFO(...)     FINGRID_LOG_INFO("[INF][calc] " __VA_ARGS__)
#define CALC_WARN(...)     FINGRID_LOG_WARN("[WRN][calc] " __VA_ARGS__)
#define CALC_ERROR(...)    FINGRID_LOG_ERROR("[ERR][calc] " __VA_ARGS__)

#if FINGRID_ENABLE_EVAL_TRACE
#define CALC_TRACE(...)    FINGRID_LOG_TRACE("[TRC][calc] " __VA_ARGS__)
#else
#define CALC_TRACE(...)    do {} while (0)
#endif

// 撤销/重做模块 (tracking)
#define TRACKING_DEBUG(...) FINGRID_LOG_DEBUG("[DBG][trak] " __VA_ARGS__)
#define TRACKING_INFO(...)  FINGRID_LOG_INFO("[INF][trak] " __VA_ARGS__)
#define TRACKING_WARN(...)  FINGRID_LOG_WARN("[WRN][trak] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     FINGRID_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)      FINGRID_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)      FINGRID_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     FINGRID_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 无头接口模块 (api)
#define API_DEBUG(...)     FINGRID_LOG_DEBUG("[DBG][api ] " __VA_ARGS__)
#define API_INFO(...)      FINGRID_LOG_INFO("[INF][api ] " __VA_ARGS__)
#define API_WARN(...)      FINGRID_LOG_WARN("[WRN][api ] " __VA_ARGS__)

// 工具模块 (utils)
#define UTILS_DEBUG(...)   FINGRID_LOG_DEBUG("[DBG][util] " __VA_ARGS__)
#define UTILS_WARN(...)    FINGRID_LOG_WARN("[WRN][util] " __VA_ARGS__)
#define UTILS_ERROR(...)   FINGRID_LOG_ERROR("[ERR][util] " __VA_ARGS__)
