/**
 * @file spider_controller.cpp
 * @brief Spider choreography controller with FreeRTOS (Pico W)
 *
 * Features:
 * - Two chained Pololu Maestros (24 servos) on UART0
 * - Named poses and animation scripts with safe-route transitions
 * - Proximity reactions through a registered distance source
 * - Serial command interface over USB
 *
 * Tasks:
 * 1. vBlinkTask (Priority: 1) - Heartbeat, fast blink while animating
 * 2. vConsoleTask (Priority: 2) - USB serial commands
 * 3. vControlTask (Priority: 3) - Owns the animator, runs queued requests
 *
 * RTOS objects:
 * - link_mutex: recursive, held by the Maestro driver for each exchange
 * - state_mutex: protects the status snapshot shown by STATUS
 * - request_queue: console -> control task animation requests
 */

#include <stdio.h>
#include <string.h>
#include <stdlib.h>

// FreeRTOS Includes
#include "FreeRTOS.h"
#include "task.h"
#include "semphr.h"
#include "queue.h"

// Pico SDK & CYW43 for the on-board LED
#include "pico/stdlib.h"
#include "pico/cyw43_arch.h"
#include "hardware/uart.h"

// Custom Drivers
#include "drivers/maestro.h"
#include "drivers/maestro_uart.h"
#include "middleware/choreography/animation.h"
#include "middleware/choreography/pose_table.h"
#include "spider_config.h"

// ============================================================================
// REQUESTS
// ============================================================================
typedef enum {
    REQUEST_SCRIPT,
    REQUEST_POSE,
    REQUEST_HOME
} request_kind_t;

typedef struct {
    request_kind_t kind;
    char name[24];
    uint16_t duration_ms;
} anim_request_t;

typedef struct {
    const char *pose;
    bool animating;
    animation_result_t last_result;
    uint32_t requests_done;
} spider_status_t;

// ============================================================================
// GLOBALS
// ============================================================================
static maestro_uart_t maestro_port;
static maestro_t maestro;
static animator_t animator;

static SemaphoreHandle_t link_mutex = NULL;
static SemaphoreHandle_t state_mutex = NULL;
static QueueHandle_t request_queue = NULL;

static spider_status_t g_status;

// Distance fed to the proximity source from the console (DIST command)
static volatile float g_bench_distance_cm = 0.0f;

void process_command(const char* cmd);

// ============================================================================
// PORT / CLOCK GLUE
// ============================================================================

static void link_lock(void *ctx) {
    (void)ctx;
    xSemaphoreTakeRecursive(link_mutex, portMAX_DELAY);
}

static void link_unlock(void *ctx) {
    (void)ctx;
    xSemaphoreGiveRecursive(link_mutex);
}

static void rtos_sleep_ms(void *ctx, uint32_t ms) {
    (void)ctx;
    vTaskDelay(pdMS_TO_TICKS(ms));
}

static uint32_t rtos_now_ms(void *ctx) {
    (void)ctx;
    return to_ms_since_boot(get_absolute_time());
}

static float bench_distance_read(void *ctx) {
    (void)ctx;
    return g_bench_distance_cm;
}

static void publish_status(animation_result_t result, bool count_request) {
    xSemaphoreTake(state_mutex, portMAX_DELAY);
    g_status.pose = animation_current_pose(&animator);
    g_status.animating = animation_is_animating(&animator);
    g_status.last_result = result;
    if (count_request) g_status.requests_done++;
    xSemaphoreGive(state_mutex);
}

// ============================================================================
// TASKS
// ============================================================================

/**
 * @brief Blink Task - Heartbeat, faster while a request is running
 */
void vBlinkTask(void *pvParameters) {
    while(1) {
        xSemaphoreTake(state_mutex, portMAX_DELAY);
        bool busy = g_status.animating;
        xSemaphoreGive(state_mutex);

        uint32_t half_period = busy ? 100 : 500;
        cyw43_arch_gpio_put(CYW43_WL_GPIO_LED_PIN, 1);
        vTaskDelay(pdMS_TO_TICKS(half_period));
        cyw43_arch_gpio_put(CYW43_WL_GPIO_LED_PIN, 0);
        vTaskDelay(pdMS_TO_TICKS(half_period));
    }
}

static animation_result_t run_request(const anim_request_t *req) {
    switch (req->kind) {
        case REQUEST_SCRIPT:
            return animation_play_script(&animator, req->name);

        case REQUEST_POSE: {
            uint16_t durations[POSE_LEG_COUNT];
            for (int leg = 0; leg < POSE_LEG_COUNT; leg++) {
                durations[leg] = req->duration_ms;
            }
            return animation_animate_to(&animator, req->name, durations);
        }

        case REQUEST_HOME: {
            maestro_status_t status = maestro_go_home(&maestro);
            if (status != MAESTRO_OK) {
                printf("[CMD] Home failed: %s\n", maestro_status_str(status));
                return ANIMATION_LINK_ERROR;
            }
            printf("[CMD] Primary unit homed, send POSE park to resync\n");
            return ANIMATION_OK;
        }
    }
    return ANIMATION_OK;
}

/**
 * @brief Control Task - Sole owner of the animator
 *
 * Puts the legs in the rest pose, then runs one request at a time from
 * request_queue. Between requests the proximity source is polled.
 */
void vControlTask(void* pvParameters) {
    anim_request_t req;

    // Gentle move to the rest pose before taking requests
    printf("[BOOT] Entering %s pose...\n", POSE_DEFAULT_REST);
    animation_result_t boot = animation_enter_pose(&animator, POSE_DEFAULT_REST);
    if (boot != ANIMATION_OK) {
        printf("[ERROR] Could not enter %s: %s\n", POSE_DEFAULT_REST, animation_result_str(boot));
        publish_status(boot, false);
        vTaskSuspend(NULL);
    }
    printf("[OK] Resting in %s\n", animation_current_pose(&animator));
    publish_status(boot, false);

    for (;;) {
        if (xQueueReceive(request_queue, &req, pdMS_TO_TICKS(SPIDER_PROXIMITY_POLL_MS)) == pdTRUE) {
            xSemaphoreTake(state_mutex, portMAX_DELAY);
            g_status.animating = true;
            xSemaphoreGive(state_mutex);

            animation_result_t result = run_request(&req);
            printf("[CMD] %s done: %s (pose '%s')\n", req.name, animation_result_str(result),
                   animation_current_pose(&animator));
            if (result == ANIMATION_LINK_ERROR) {
                printf("[CMD] Link status: %s\n",
                       maestro_status_str(animation_last_link_status(&animator)));
            }
            publish_status(result, true);
        } else {
            animation_result_t result = animation_poll_proximity(&animator);
            if (result != ANIMATION_OK) {
                printf("[CMD] Proximity reaction: %s\n", animation_result_str(result));
                publish_status(result, false);
            }
        }
    }
}

/**
 * @brief Console Task - USB serial command line
 */
void vConsoleTask(void* pvParameters) {
    char line[SPIDER_CONSOLE_LINE_MAX];
    size_t len = 0;

    printf("\n=== Spider Ready ===\n");
    printf("Commands: ANIM, POSE, HOME, POS, ERRORS, DIST, STATUS, LIST, HELP\n");
    printf("spider> ");
    fflush(stdout);

    for (;;) {
        int ch;
        // Drain everything the host has typed since the last tick
        while ((ch = getchar_timeout_us(0)) != PICO_ERROR_TIMEOUT) {
            if (ch == '\r' || ch == '\n') {
                if (len == 0) continue;
                line[len] = '\0';
                len = 0;
                printf("\n");
                process_command(line);
                printf("spider> ");
            } else if ((ch == '\b' || ch == 0x7F) && len > 0) {
                len--;
                printf("\b \b");
            } else if (ch >= ' ' && ch <= '~' && len < sizeof(line) - 1) {
                line[len++] = (char)ch;
                putchar(ch);
            }
            fflush(stdout);
        }

        vTaskDelay(pdMS_TO_TICKS(SPIDER_CONSOLE_POLL_MS));
    }
}

// ============================================================================
// COMMAND PROCESSING
// ============================================================================

static void post_request(request_kind_t kind, const char *name, uint16_t duration_ms) {
    anim_request_t req;
    req.kind = kind;
    strncpy(req.name, name, sizeof(req.name) - 1);
    req.name[sizeof(req.name) - 1] = '\0';
    req.duration_ms = duration_ms;

    if (xQueueSend(request_queue, &req, 0) != pdTRUE) {
        printf("[CMD] Request queue full, '%s' dropped\n", req.name);
        return;
    }
    printf("[CMD] Queued %s\n", req.name);
}

static void print_lists(void) {
    printf("\n=== Scripts ===\n");
    for (size_t i = 0; i < script_table_count(); i++) {
        const animation_script_t *script = script_table_get(i);
        printf("  %-12s %u steps\n", script->name, (unsigned)script->step_count);
    }
    printf("=== Poses ===\n");
    for (size_t i = 0; i < pose_table_count(); i++) {
        const pose_t *pose = pose_table_get(i);
        printf("  %-16s via:", pose->name);
        for (size_t r = 0; r < pose_route_count(pose); r++) {
            printf(" %s", pose->safe_routes[r]);
        }
        printf("\n");
    }
}

static void print_errors(void) {
    const uint8_t devices[2] = {MAESTRO_DEVICE_PRIMARY, MAESTRO_DEVICE_SECONDARY};
    for (int i = 0; i < 2; i++) {
        uint16_t errors = 0;
        if (maestro_get_errors(&maestro, devices[i], &errors) == MAESTRO_OK) {
            printf("[CMD] Maestro #%u errors: 0x%04X\n", devices[i], errors);
        }
    }
}

void process_command(const char* cmd) {
    if (!cmd || strlen(cmd) == 0) return;

    // Keyword is case-insensitive, pose and script names are lowercase
    char cmd_upper[64];
    char arg[32] = "";
    char arg2[16] = "";
    char keyword[16] = "";
    strncpy(cmd_upper, cmd, sizeof(cmd_upper) - 1);
    cmd_upper[sizeof(cmd_upper) - 1] = '\0';
    for (int i = 0; cmd_upper[i]; i++) {
        if (cmd_upper[i] >= 'A' && cmd_upper[i] <= 'Z') cmd_upper[i] += 32;
    }
    sscanf(cmd_upper, "%15s %31s %15s", keyword, arg, arg2);
    for (int i = 0; keyword[i]; i++) {
        if (keyword[i] >= 'a' && keyword[i] <= 'z') keyword[i] -= 32;
    }

    if (strcmp(keyword, "ANIM") == 0 || strcmp(keyword, "A") == 0) {
        if (!script_table_find(arg)) {
            printf("[CMD] Unknown script: %s (try LIST)\n", arg);
            return;
        }
        post_request(REQUEST_SCRIPT, arg, 0);
    }
    else if (strcmp(keyword, "POSE") == 0 || strcmp(keyword, "P") == 0) {
        if (!pose_table_find(arg)) {
            printf("[CMD] Unknown pose: %s (try LIST)\n", arg);
            return;
        }
        int ms = arg2[0] ? atoi(arg2) : SPIDER_DEFAULT_MOVE_MS;
        if (ms <= 0 || ms > 10000) {
            printf("[CMD] Move time must be 1..10000 ms\n");
            return;
        }
        post_request(REQUEST_POSE, arg, (uint16_t)ms);
    }
    else if (strcmp(keyword, "HOME") == 0) {
        post_request(REQUEST_HOME, "home", 0);
    }
    else if (strcmp(keyword, "POS") == 0) {
        int channel = atoi(arg);
        if (!arg[0] || channel < 0 || channel >= MAESTRO_CHANNEL_COUNT) {
            printf("[CMD] Usage: POS <0..23>\n");
            return;
        }
        uint16_t pulse = 0;
        maestro_status_t status = maestro_get_position(&maestro, (uint8_t)channel, &pulse);
        if (status == MAESTRO_OK) {
            printf("[CMD] CH%d at %u us\n", channel, pulse);
        } else {
            printf("[CMD] CH%d position %s\n", channel,
                   status == MAESTRO_ERR_TIMEOUT ? "unknown" : maestro_status_str(status));
        }
    }
    else if (strcmp(keyword, "ERRORS") == 0) {
        print_errors();
    }
    else if (strcmp(keyword, "DIST") == 0) {
        g_bench_distance_cm = (float)atof(arg);
        printf("[CMD] Proximity source now reads %.1f cm\n", g_bench_distance_cm);
    }
    else if (strcmp(keyword, "STATUS") == 0) {
        xSemaphoreTake(state_mutex, portMAX_DELAY);
        spider_status_t snapshot = g_status;
        xSemaphoreGive(state_mutex);

        printf("\n=== System Status ===\n");
        printf("Pose: %s  State: %s  Last: %s\n",
               snapshot.pose ? snapshot.pose : "?",
               snapshot.animating ? "ANIMATING" : "IDLE",
               animation_result_str(snapshot.last_result));
        printf("Requests: %lu done, %lu queued\n",
               (unsigned long)snapshot.requests_done,
               (unsigned long)uxQueueMessagesWaiting(request_queue));
        printf("Link: %lu query timeouts, %lu stale bytes flushed\n",
               (unsigned long)maestro_timeout_count(&maestro),
               (unsigned long)maestro_port.bytes_flushed);
    }
    else if (strcmp(keyword, "LIST") == 0) {
        print_lists();
    }
    else if (strcmp(keyword, "HELP") == 0 || strcmp(keyword, "?") == 0) {
        printf("\n=== Available Commands ===\n");
        printf("Motion:   ANIM/A <script>, POSE/P <pose> [ms], HOME\n");
        printf("Link:     POS <channel>, ERRORS\n");
        printf("Bench:    DIST <cm>  (0 = no echo)\n");
        printf("System:   STATUS, LIST, HELP\n");
    }
    else {
        printf("[CMD] Unknown command: %s\n", keyword);
    }
}

// ============================================================================
// MAIN
// ============================================================================
int main() {
    // Initialize stdio (USB)
    stdio_init_all();
    sleep_ms(2000);  // Wait for USB serial

    printf("\n");
    printf("=================================\n");
    printf("  Spider Controller (Maestro x2)\n");
    printf("=================================\n\n");

    // Initialize CYW43 (LED)
    printf("[BOOT] Initializing CYW43...\n");
    if (cyw43_arch_init()) {
        printf("[ERROR] Failed to initialize CYW43\n");
        while(1) sleep_ms(1000);
    }
    printf("[OK] CYW43 initialized\n");

    // Check tables before anything moves
    printf("[BOOT] Checking pose tables...\n");
    if (!pose_table_validate()) {
        printf("[ERROR] Pose tables invalid\n");
        while(1) sleep_ms(1000);
    }
    printf("[OK] %u poses, %u scripts\n", (unsigned)pose_table_count(), (unsigned)script_table_count());

    // Create RTOS objects
    printf("[BOOT] Creating RTOS objects...\n");
    link_mutex = xSemaphoreCreateRecursiveMutex();
    state_mutex = xSemaphoreCreateMutex();
    request_queue = xQueueCreate(SPIDER_REQUEST_QUEUE_LEN, sizeof(anim_request_t));

    if (!link_mutex || !state_mutex || !request_queue) {
        printf("[ERROR] Failed to create RTOS objects\n");
        while(1) sleep_ms(1000);
    }
    printf("[OK] RTOS objects created\n");

    // Initialize Maestro link
    printf("[BOOT] Initializing Maestro link...\n");
    if (!maestro_uart_init(&maestro_port, SPIDER_MAESTRO_UART, SPIDER_MAESTRO_TX_PIN,
                           SPIDER_MAESTRO_RX_PIN, SPIDER_MAESTRO_BAUD)) {
        printf("[ERROR] Maestro UART init failed!\n");
        while(1) sleep_ms(1000);
    }

    maestro_transport_t transport;
    maestro_uart_bind(&maestro_port, &transport);
    transport.lock = link_lock;
    transport.unlock = link_unlock;
    maestro_init(&maestro, &transport, SPIDER_MAESTRO_TIMEOUT_US);
    maestro_set_crc(&maestro, SPIDER_MAESTRO_CRC != 0);
    printf("[OK] Maestro link ready\n");

    // Initialize animator
    printf("[BOOT] Initializing animator...\n");
    animation_clock_t clock;
    clock.ctx = NULL;
    clock.sleep_ms = rtos_sleep_ms;
    clock.now_ms = rtos_now_ms;
    animation_init(&animator, &maestro, &clock, NULL);
    animation_set_proximity_source(&animator, bench_distance_read, NULL);
    printf("[OK] Animator ready\n");

    g_status.pose = animation_current_pose(&animator);
    g_status.animating = true;
    g_status.last_result = ANIMATION_OK;
    g_status.requests_done = 0;

    // Create FreeRTOS Tasks
    printf("[BOOT] Creating tasks...\n");
    xTaskCreate(vBlinkTask,   "Blink",   SPIDER_STACK_BLINK,   NULL, SPIDER_PRIO_BLINK,   NULL);
    xTaskCreate(vConsoleTask, "Console", SPIDER_STACK_CONSOLE, NULL, SPIDER_PRIO_CONSOLE, NULL);
    xTaskCreate(vControlTask, "Control", SPIDER_STACK_CONTROL, NULL, SPIDER_PRIO_CONTROL, NULL);
    printf("[OK] Tasks created\n");

    // Start Scheduler
    printf("\n[BOOT COMPLETE] Starting FreeRTOS Scheduler...\n\n");
    vTaskStartScheduler();

    // Should never reach here
    printf("[FATAL] Scheduler exited!\n");
    while (1) {
        sleep_ms(1000);
    }
}

// ============================================================================
// FREERTOS HOOKS
// ============================================================================
extern "C" {

void vApplicationStackOverflowHook(TaskHandle_t xTask, char *pcTaskName) {
    printf("[FATAL] Stack overflow in task: %s\n", pcTaskName);
    while (1) { tight_loop_contents(); }
}

void vApplicationMallocFailedHook(void) {
    printf("[FATAL] Malloc failed!\n");
    while (1) { tight_loop_contents(); }
}

void vSpiderAssertFailed(const char *file, int line) {
    taskDISABLE_INTERRUPTS();
    printf("[FATAL] Kernel assert at %s:%d\n", file, line);
    while (1) { tight_loop_contents(); }
}

static StaticTask_t xIdleTaskTCBBuffer;
static StackType_t xIdleStack[configMINIMAL_STACK_SIZE];

void vApplicationGetIdleTaskMemory(StaticTask_t **ppxIdleTaskTCBBuffer,
                                   StackType_t **ppxIdleTaskStackBuffer,
                                   configSTACK_DEPTH_TYPE *pulIdleTaskStackSize) {
    *ppxIdleTaskTCBBuffer = &xIdleTaskTCBBuffer;
    *ppxIdleTaskStackBuffer = xIdleStack;
    *pulIdleTaskStackSize = configMINIMAL_STACK_SIZE;
}

} // extern "C"
