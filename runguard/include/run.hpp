#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序，并将运行结果写入 meta 文件
 * @note 该函数必须在 main 函数最后调用
 * 1. 分离 IPC、NS、UTS、SYSVSEM 命名空间，不共享网络时同时分离 NET 命名空间
 * 2. fork 出子进程，子进程清除环境变量、设置资源限制、切换到独立的进程组和工作目录后执行命令
 * 3. 父进程作为看门狗：
 *    1. 收到 SIGALRM（时钟时间超限）或者 SIGTERM（评测被取消）时杀死整个进程组
 *    2. 通过非阻塞管道转发子进程的标准输出和标准错误，超过 stream_size 的部分丢弃
 * 4. 子进程退出后杀死进程组内残留的后台进程，再读出管道中剩余的数据
 * 5. 通过 getrusage 统计运行时间、内存使用，连同退出码、超时结果、截断情况写入 meta 文件
 * @return 命令的退出码，被信号终止时为 128 + 信号编号
 */
int runit(struct runguard_options opt);
