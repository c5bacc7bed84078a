/**
 * @file cb_codebreak.cpp
 * @brief C API обёртка над codebreak::GameSession
 *
 * Все функции extern "C" и noexcept: исключение, дошедшее до границы C,
 * привело бы к std::terminate(), поэтому они перехватываются внутри
 * GameSession.
 *
 * @see cb_codebreak.h, cb_codebreak_internals.hpp
 */

#include "cb_codebreak.h"

#include "cb_codebreak_internals.hpp"

extern "C" {

void* codebreak_create(const GameConfig_t* config) noexcept {
  return codebreak::GameSession::create(config);
}

void codebreak_destroy(void* game) noexcept {
  codebreak::GameSession::destroy(game);
}

void codebreak_handle_input(void* game, UserAction_t action,
                            bool hold) noexcept {
  codebreak::GameSession::handle_input(game, action, hold);
}

void codebreak_update(void* game) noexcept {
  codebreak::GameSession::update(game);
}

void codebreak_resize(void* game, int width, int height) noexcept {
  codebreak::GameSession::resize(game, width, height);
}

const GameInfo_t* codebreak_get_info(const void* game) noexcept {
  return codebreak::GameSession::get_info(game);
}

GameInterface_t codebreak_get_interface(void) noexcept {
  GameInterface_t iface = {};
  iface.create = codebreak_create;
  iface.destroy = codebreak_destroy;
  iface.input = codebreak_handle_input;
  iface.update = codebreak_update;
  iface.resize = codebreak_resize;
  iface.get_info = codebreak_get_info;
  return iface;
}

}  // extern "C"
