#pragma once

namespace arbiter {

/**
 * @brief worker 线程的状态
 */
enum class worker_state {
    /**
     * @brief worker 线程已经启动，还没有开始评测
     */
    START,

    /**
     * @brief worker 正在评测提交
     */
    JUDGING,

    /**
     * @brief worker 正在等待新的提交
     */
    IDLE,

    /**
     * @brief worker 线程已经正常退出
     */
    STOPPED,

    /**
     * @brief worker 线程因为未处理的异常退出
     */
    CRASHED
};

const char *get_display_message(worker_state);

}  // namespace arbiter
