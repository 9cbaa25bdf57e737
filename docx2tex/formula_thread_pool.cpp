// formula_thread_pool.cpp
// Thread pool implementation for parallel formula conversion

#include "formula_thread_pool.h"
#include "../lib/log.h"
#include <stdlib.h>
#include <unistd.h>

// Fallback when the CPU count is unavailable
#define DEFAULT_THREAD_COUNT 4

static int online_cpu_count() {
    long n = sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? (int)n : DEFAULT_THREAD_COUNT;
}

// Worker thread function
static void* worker_thread_func(void* arg) {
    FormulaThreadPool* pool = (FormulaThreadPool*)arg;

    log_debug("formula-pool: worker thread %lu started", (unsigned long)pthread_self());

    while (true) {
        pthread_mutex_lock(&pool->queue_mutex);

        // Wait for tasks or shutdown
        while (!pool->head && !pool->shutdown_flag) {
            pthread_cond_wait(&pool->queue_cond, &pool->queue_mutex);
        }

        // Queue drained and shutdown requested
        if (!pool->head) {
            pthread_mutex_unlock(&pool->queue_mutex);
            break;
        }

        FormulaTask* task = pool->head;
        pool->head = task->next;
        if (!pool->head) pool->tail = NULL;
        pool->active_count++;
        pool->queued_count--;

        pthread_mutex_unlock(&pool->queue_mutex);

        // Execute task outside of lock
        task->task_fn(task->task_data);
        free(task);

        pthread_mutex_lock(&pool->queue_mutex);
        pool->active_count--;
        if (pool->active_count == 0 && !pool->head) {
            pthread_cond_broadcast(&pool->idle_cond);
        }
        pthread_mutex_unlock(&pool->queue_mutex);
    }

    log_debug("formula-pool: worker thread %lu exiting", (unsigned long)pthread_self());
    return NULL;
}

// Create thread pool
FormulaThreadPool* formula_pool_create(int num_threads) {
    if (num_threads <= 0) {
        num_threads = online_cpu_count();
    }

    FormulaThreadPool* pool = (FormulaThreadPool*)calloc(1, sizeof(FormulaThreadPool));
    if (!pool) return NULL;

    pool->num_threads = num_threads;

    if (pthread_mutex_init(&pool->queue_mutex, NULL) != 0) {
        free(pool);
        return NULL;
    }
    if (pthread_cond_init(&pool->queue_cond, NULL) != 0) {
        pthread_mutex_destroy(&pool->queue_mutex);
        free(pool);
        return NULL;
    }
    if (pthread_cond_init(&pool->idle_cond, NULL) != 0) {
        pthread_cond_destroy(&pool->queue_cond);
        pthread_mutex_destroy(&pool->queue_mutex);
        free(pool);
        return NULL;
    }

    pool->threads = (pthread_t*)calloc(num_threads, sizeof(pthread_t));
    if (!pool->threads) {
        pthread_cond_destroy(&pool->idle_cond);
        pthread_cond_destroy(&pool->queue_cond);
        pthread_mutex_destroy(&pool->queue_mutex);
        free(pool);
        return NULL;
    }

    // Start worker threads
    for (int i = 0; i < num_threads; i++) {
        if (pthread_create(&pool->threads[i], NULL, worker_thread_func, pool) != 0) {
            log_error("formula-pool: failed to create worker thread %d", i);
            pthread_mutex_lock(&pool->queue_mutex);
            pool->shutdown_flag = true;
            pthread_cond_broadcast(&pool->queue_cond);
            pthread_mutex_unlock(&pool->queue_mutex);

            for (int j = 0; j < i; j++) {
                pthread_join(pool->threads[j], NULL);
            }

            free(pool->threads);
            pthread_cond_destroy(&pool->idle_cond);
            pthread_cond_destroy(&pool->queue_cond);
            pthread_mutex_destroy(&pool->queue_mutex);
            free(pool);
            return NULL;
        }
    }

    log_debug("formula-pool: created thread pool with %d workers", num_threads);
    return pool;
}

// Destroy thread pool; queued tasks still run before the workers exit
void formula_pool_destroy(FormulaThreadPool* pool) {
    if (!pool) return;

    log_debug("formula-pool: destroying thread pool");

    pthread_mutex_lock(&pool->queue_mutex);
    pool->shutdown_flag = true;
    pthread_cond_broadcast(&pool->queue_cond);
    pthread_mutex_unlock(&pool->queue_mutex);

    for (int i = 0; i < pool->num_threads; i++) {
        pthread_join(pool->threads[i], NULL);
    }

    free(pool->threads);
    pthread_cond_destroy(&pool->idle_cond);
    pthread_cond_destroy(&pool->queue_cond);
    pthread_mutex_destroy(&pool->queue_mutex);
    free(pool);

    log_debug("formula-pool: thread pool destroyed");
}

// Enqueue task at the tail
bool formula_pool_enqueue(FormulaThreadPool* pool, FormulaTaskFunction task_fn, void* task_data) {
    if (!pool || !task_fn) return false;

    FormulaTask* task = (FormulaTask*)malloc(sizeof(FormulaTask));
    if (!task) {
        log_error("formula-pool: out of memory enqueuing task");
        return false;
    }
    task->task_fn = task_fn;
    task->task_data = task_data;
    task->next = NULL;

    pthread_mutex_lock(&pool->queue_mutex);

    if (pool->shutdown_flag) {
        pthread_mutex_unlock(&pool->queue_mutex);
        free(task);
        return false;
    }

    if (pool->tail) {
        pool->tail->next = task;
    } else {
        pool->head = task;
    }
    pool->tail = task;
    pool->queued_count++;
    int queued = pool->queued_count;
    pthread_cond_signal(&pool->queue_cond);  // Wake up one worker

    pthread_mutex_unlock(&pool->queue_mutex);

    log_debug("formula-pool: enqueued task (%d tasks queued)", queued);
    return true;
}

// Wait for all queued and running tasks to complete
void formula_pool_wait_all(FormulaThreadPool* pool) {
    if (!pool) return;

    pthread_mutex_lock(&pool->queue_mutex);
    while (pool->active_count > 0 || pool->head) {
        pthread_cond_wait(&pool->idle_cond, &pool->queue_mutex);
    }
    pthread_mutex_unlock(&pool->queue_mutex);

    log_debug("formula-pool: all tasks completed");
}

int formula_pool_get_active_count(FormulaThreadPool* pool) {
    if (!pool) return 0;
    pthread_mutex_lock(&pool->queue_mutex);
    int n = pool->active_count;
    pthread_mutex_unlock(&pool->queue_mutex);
    return n;
}

int formula_pool_get_queued_count(FormulaThreadPool* pool) {
    if (!pool) return 0;
    pthread_mutex_lock(&pool->queue_mutex);
    int n = pool->queued_count;
    pthread_mutex_unlock(&pool->queue_mutex);
    return n;
}
