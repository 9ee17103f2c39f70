#include <vesper/protocol.hpp>

namespace vesper
{

namespace
{

// The request body never reaches the runtime, so the serialized payload
// travels in a header.  Falls back to window.ipc.postMessage when the custom
// protocol is blocked.
constexpr std::string_view INVOKE_SYSTEM_SCRIPT = R"JS(;(function () {
  const toIpcPayload = function (message) {
    const data = JSON.stringify(message, (_key, value) => {
      const SERIALIZE_TO_IPC_FN = '__TAURI_TO_IPC_KEY__'
      if (value instanceof Map) {
        return Object.fromEntries(value.entries())
      } else if (value instanceof Uint8Array) {
        return Array.from(value)
      } else if (value instanceof ArrayBuffer) {
        return Array.from(new Uint8Array(value))
      } else if (typeof value === 'object' && value !== null && SERIALIZE_TO_IPC_FN in value) {
        return value[SERIALIZE_TO_IPC_FN]()
      } else if (value instanceof Object && '__TAURI_CHANNEL_MARKER__' in value && typeof value.id === 'number') {
        return `__CHANNEL__:${value.id}`
      }
      return value
    })
    return { contentType: 'application/json', data }
  }

  const invokeKey = __INVOKE_KEY__
  let protocolBlocked = false

  function send(message) {
    const { cmd, callback, error, payload, options } = message

    if (protocolBlocked) {
      const { data } = toIpcPayload({
        cmd,
        callback,
        error,
        options: { ...options, customProtocolIpcBlocked: true },
        payload,
        __TAURI_INVOKE_KEY__: invokeKey,
      })
      window.ipc.postMessage(data)
      return
    }

    const { contentType, data } = toIpcPayload(payload)
    fetch(window.__TAURI_INTERNALS__.convertFileSrc(cmd, 'ipc'), {
      method: 'POST',
      headers: {
        'Content-Type': contentType,
        'Tauri-Callback': callback,
        'Tauri-Error': error,
        'Tauri-Invoke-Key': invokeKey,
        'Tauri-VersoRuntime-Invoke-Body': encodeURIComponent(data),
        ...((options && options.headers) || {}),
      },
    })
      .then((response) => {
        const cb = response.headers.get('Tauri-Response') === 'ok' ? callback : error
        switch ((response.headers.get('content-type') || '').split(',')[0]) {
          case 'application/json':
            return response.json().then((r) => [cb, r])
          case 'text/plain':
            return response.text().then((r) => [cb, r])
          default:
            return response.arrayBuffer().then((r) => [cb, r])
        }
      })
      .then(([cb, data]) => {
        if (window[`_${cb}`]) {
          window[`_${cb}`](data)
        } else {
          console.warn(`[TAURI] No callback ${cb} registered; the page may have reloaded.`)
        }
      })
      .catch((e) => {
        console.warn('IPC custom protocol failed, using postMessage instead', e)
        protocolBlocked = true
        send(message)
      })
  }

  Object.defineProperty(window.__TAURI_INTERNALS__, 'postMessage', { value: send })
})()
)JS";

}   // namespace

std::string_view invoke_system_script()
{
    return INVOKE_SYSTEM_SCRIPT;
}

}   // namespace vesper
