#include "ClientScript.hpp"

namespace lp {
namespace {
const char* SCRIPT_TEMPLATE = R"JS((function () {
  if (window.__livePatch) { return; }
  var POLL_PATH = '@POLL_PATH@';
  var INVALID_PATH = '@INVALID_PATH@';
  var WS_PATH = '@WS_PATH@';
  var POLL_PERIOD_MS = 1500;
  var BACKOFF_BASE_MS = 1200;
  var BACKOFF_MAX_MS = 10000;
  var MAX_ATTEMPT = 6;

  var socket = null;
  var attempt = 0;
  var reconnectTimer = 0;
  var pollTimer = 0;

  function reportInvalid(id) {
    if (!id) { return; }
    try {
      fetch(INVALID_PATH, {
        method: 'POST',
        headers: { 'Content-Type': 'application/json' },
        body: JSON.stringify({ id: id })
      }).catch(function () {});
    } catch (e) {}
  }

  function apply(patch) {
    if (!patch || typeof patch !== 'object') { return; }
    var id = String(patch.id || '');
    if (!id) { return; }
    var el = document.getElementById(id);
    if (!el) {
      reportInvalid(id);
      return;
    }
    var html = String(patch.html || '');
    switch (String(patch.swap || 'inline')) {
      case 'outline': el.outerHTML = html; break;
      case 'append': el.insertAdjacentHTML('beforeend', html); break;
      case 'prepend': el.insertAdjacentHTML('afterbegin', html); break;
      case 'none': break;
      default: el.innerHTML = html; break;
    }
  }

  function applyAll(patches) {
    if (!Array.isArray(patches)) { return; }
    for (var i = 0; i < patches.length; i++) {
      try { apply(patches[i]); } catch (e) {}
    }
  }

  function onMessage(event) {
    var message;
    try { message = JSON.parse(event.data); } catch (e) { return; }
    if (!message || typeof message !== 'object') { return; }
    if (message.type === 'patch') {
      applyAll(message.patches);
    } else if (message.type === 'reload') {
      window.location.reload();
    }
  }

  function poll() {
    fetch(POLL_PATH, { method: 'GET', headers: { 'Accept': 'application/json' } })
      .then(function (resp) {
        if (!resp.ok) { throw new Error('HTTP ' + resp.status); }
        return resp.json();
      })
      .then(function (body) { if (body) { applyAll(body.patches); } })
      .catch(function () {});
  }

  function startPolling() {
    if (pollTimer) { return; }
    poll();
    pollTimer = setInterval(poll, POLL_PERIOD_MS);
  }

  function stopPolling() {
    if (!pollTimer) { return; }
    clearInterval(pollTimer);
    pollTimer = 0;
  }

  function scheduleReconnect() {
    if (reconnectTimer) { return; }
    var delay = Math.min(BACKOFF_BASE_MS * Math.pow(2, attempt), BACKOFF_MAX_MS);
    attempt = Math.min(attempt + 1, MAX_ATTEMPT);
    reconnectTimer = setTimeout(function () {
      reconnectTimer = 0;
      connect();
    }, delay);
  }

  function onDisconnect() {
    if (socket) {
      socket.onopen = socket.onmessage = socket.onclose = socket.onerror = null;
      socket = null;
    }
    scheduleReconnect();
    startPolling();
  }

  function connect() {
    var host = window.location.host;
    if (!host) {
      startPolling();
      return;
    }
    var scheme = window.location.protocol === 'https:' ? 'wss' : 'ws';
    try {
      socket = new WebSocket(scheme + '://' + host + WS_PATH);
    } catch (e) {
      onDisconnect();
      return;
    }
    socket.onopen = function () {
      attempt = 0;
      stopPolling();
      poll();
    };
    socket.onmessage = onMessage;
    socket.onerror = onDisconnect;
    socket.onclose = onDisconnect;
  }

  window.__livePatch = { poll: poll, reportInvalid: reportInvalid };
  connect();
  startPolling();
})();
)JS";

void replaceAll(string* s, const string& from, const string& to) {
  size_t pos = 0;
  while ((pos = s->find(from, pos)) != string::npos) {
    s->replace(pos, from.length(), to);
    pos += to.length();
  }
}
}  // namespace

string ClientScript::source() {
  string script = SCRIPT_TEMPLATE;
  replaceAll(&script, "@POLL_PATH@", POLL_PATH);
  replaceAll(&script, "@INVALID_PATH@", INVALID_TARGET_PATH);
  replaceAll(&script, "@WS_PATH@", WEBSOCKET_PATH);
  return script;
}

string ClientScript::tag() {
  return "<script src=\"" + CLIENT_SCRIPT_PATH + "\" defer></script>";
}
}  // namespace lp
