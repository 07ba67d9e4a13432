#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// kind: 0 = text, 1 = sound id. The host answers with phon_speech_finished(token, ...).
typedef void (*phon_speak_fn)(unsigned long long token, int kind, const char *value,
                              void *user_data);
typedef void (*phon_stop_fn)(void *user_data);

// Every char* result is a JSON envelope {"status":"ok"|"error", ..., "events":[...]}
// owned by the caller and released with phon_free_string.
char *phon_set_storage_root(const char *path);
char *phon_set_config(const char *config_json);
void phon_set_synthesizer(phon_speak_fn speak, phon_stop_fn stop, void *user_data);
void phon_speech_finished(unsigned long long token, int ok, const char *error);
char *phon_start_session(const char *profile_id, const char *mode);
char *phon_next_item(void);
char *phon_select_letter(const char *letter_id);
char *phon_confirm_letter(int position, const char *letter_id);
char *phon_request_explore(const char *letter_id);
char *phon_replay(void);
char *phon_pause(void);
char *phon_resume(void);
char *phon_end_session(void);
int phon_has_active_session(void);
void phon_free_string(char *ptr);

#ifdef __cplusplus
}
#endif
