// formula_thread_pool.h
// Worker pool for converting the formulas of a document in parallel
// Tasks run in FIFO order; each task owns its own result slot

#ifndef FORMULA_THREAD_POOL_H
#define FORMULA_THREAD_POOL_H

#include <pthread.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// Task function signature
typedef void (*FormulaTaskFunction)(void* task_data);

// Queued task
typedef struct FormulaTask {
    FormulaTaskFunction task_fn; // Task function to execute
    void* task_data;             // Argument handed to task_fn
    struct FormulaTask* next;    // Next task in FIFO order
} FormulaTask;

// Thread pool structure
typedef struct FormulaThreadPool {
    int num_threads;             // Number of worker threads
    pthread_t* threads;          // Worker thread handles

    FormulaTask* head;           // Oldest queued task
    FormulaTask* tail;           // Newest queued task
    pthread_mutex_t queue_mutex; // Protects queue and counters
    pthread_cond_t queue_cond;   // Signals new tasks
    pthread_cond_t idle_cond;    // Signals that the pool went idle

    bool shutdown_flag;          // Shutdown requested
    int active_count;            // Number of workers running a task
    int queued_count;            // Number of queued tasks
} FormulaThreadPool;

// Create and destroy thread pool (num_threads <= 0: one per online CPU)
FormulaThreadPool* formula_pool_create(int num_threads);
void formula_pool_destroy(FormulaThreadPool* pool);

// Task management
bool formula_pool_enqueue(FormulaThreadPool* pool, FormulaTaskFunction task_fn, void* task_data);
void formula_pool_wait_all(FormulaThreadPool* pool);

// Statistics
int formula_pool_get_active_count(FormulaThreadPool* pool);
int formula_pool_get_queued_count(FormulaThreadPool* pool);

#ifdef __cplusplus
}
#endif

#endif // FORMULA_THREAD_POOL_H
