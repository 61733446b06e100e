#pragma once

#ifdef __cplusplus
extern "C" {
#endif

typedef struct cookie_game cookie_game;

/*
 * Creates a game. `config_json` may be NULL or empty for the defaults.
 * `high_score_path` NULL uses the config's highScorePath; an empty string
 * keeps the high score in memory only. Returns NULL on failure.
 */
cookie_game *cookie_create(const char *config_json, const char *high_score_path);
void cookie_destroy(cookie_game *game);

/*
 * Every char* below is a JSON envelope, {"status": "ok", ...} or
 * {"status": "error", "message": "..."}, to be released with
 * cookie_free_string.
 */
char *cookie_practice_mode(cookie_game *game);
char *cookie_test_mode(cookie_game *game);
char *cookie_submit_questions(cookie_game *game, const char *questions_json);
char *cookie_back_to_menu(cookie_game *game);
char *cookie_play_again(cookie_game *game);
char *cookie_main_menu(cookie_game *game);

char *cookie_drop_cookie(cookie_game *game, int monster_id);
char *cookie_submit_answer(cookie_game *game);
char *cookie_tick(cookie_game *game, double dt);
char *cookie_pause(cookie_game *game);
char *cookie_resume(cookie_game *game);

/*
 * Events and presentation commands raised since the previous poll. Both
 * queues grow until polled, so the host polls once per frame. Consecutive
 * TimerUpdated events are merged into the latest one.
 */
char *cookie_poll_events(cookie_game *game);
char *cookie_state(cookie_game *game);

void cookie_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
