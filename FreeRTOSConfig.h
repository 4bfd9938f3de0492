#ifndef FREERTOS_CONFIG_H
#define FREERTOS_CONFIG_H

/*
 * FreeRTOS config for the spider controller (Pico W, core 0 only)
 *
 * Tasks: Control (owns the animator), Console (USB command line), Blink.
 * The Maestro link is shared between Control and Console through a
 * recursive mutex; requests reach Control through one queue.
 */

/* Scheduler */
#define configUSE_PREEMPTION                    1
#define configUSE_PORT_OPTIMISED_TASK_SELECTION 0
#define configUSE_TICKLESS_IDLE                 0
#define configCPU_CLOCK_HZ                      125000000
#define configTICK_RATE_HZ                      1000    /* 1 ms settle poll resolution */
#define configMAX_PRIORITIES                    4       /* idle + blink/console/control */
#define configMINIMAL_STACK_SIZE                128
#define configMAX_TASK_NAME_LEN                 12
#define configUSE_16_BIT_TICKS                  0
#define configIDLE_SHOULD_YIELD                 1
#define configUSE_TIME_SLICING                  1
#define configSTACK_DEPTH_TYPE                  uint16_t

/* Queues and locks */
#define configUSE_MUTEXES                       1
#define configUSE_RECURSIVE_MUTEXES             1
#define configUSE_COUNTING_SEMAPHORES           0
#define configUSE_EVENT_GROUPS                  1   /* port sync interop */
#define configUSE_QUEUE_SETS                    0
#define configUSE_TASK_NOTIFICATIONS            1
#define configQUEUE_REGISTRY_SIZE               0

/* Memory: three small tasks plus one request queue */
#define configSUPPORT_STATIC_ALLOCATION         1
#define configSUPPORT_DYNAMIC_ALLOCATION        1
#define configTOTAL_HEAP_SIZE                   (32 * 1024)
#define configAPPLICATION_ALLOCATED_HEAP        0

/* Single core; core 1 stays unused */
#define configNUMBER_OF_CORES                   1
#define configTICK_CORE                         0
#define configRUN_MULTIPLE_PRIORITIES           0

/* Hooks (implemented in spider_controller.cpp) */
#define configUSE_IDLE_HOOK                     0
#define configUSE_TICK_HOOK                     0
#define configCHECK_FOR_STACK_OVERFLOW          2
#define configUSE_MALLOC_FAILED_HOOK            1
#define configUSE_TIMERS                        0

#ifndef __ASSEMBLER__
#ifdef __cplusplus
extern "C" {
#endif
void vSpiderAssertFailed(const char *file, int line);
#ifdef __cplusplus
}
#endif
#define configASSERT(x) do { if ((x) == 0) vSpiderAssertFailed(__FILE__, __LINE__); } while (0)
#endif

/* Optional API */
#define INCLUDE_vTaskDelay                      1
#define INCLUDE_vTaskDelayUntil                 0
#define INCLUDE_vTaskDelete                     0
#define INCLUDE_vTaskSuspend                    1
#define INCLUDE_xTaskGetSchedulerState          1
#define INCLUDE_xTaskGetCurrentTaskHandle       1
#define INCLUDE_xSemaphoreGetMutexHolder        0

/* RP2040 port ISR names */
#define vPortSVCHandler                         isr_svcall
#define xPortPendSVHandler                      isr_pendsv
#define xPortSysTickHandler                     isr_systick

#endif /* FREERTOS_CONFIG_H */
